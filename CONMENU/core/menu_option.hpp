#pragma once

#include <functional>
#include <string>
#include <utility>

// One selectable row: a label and the action run when it is confirmed.
// The action may be invoked many times and may itself show another Menu.
struct MenuOption {
    std::string           label  = "exit";
    std::function<void()> action = [] {};

    MenuOption() = default;
    MenuOption(std::string l, std::function<void()> a)
    : label(std::move(l)), action(std::move(a)) {}
};
