#pragma once

#include <memory>
#include <vector>

#include "core/menu_option.hpp"
#include "core/menu_props.hpp"
#include "core/menu_navigator.hpp"
#include "layout/menu_layout.hpp"
#include "utils/terminal.hpp"

class MenuLogger;

/*
  Interactive console menu.

    std::vector<MenuOption> options{
        {"option 1", [] { std::cout << "one\n"; }},
        {"option 2", [] { std::cout << "two\n"; }},
    };
    Menu menu(std::move(options), default_menu_props());
    menu.show();

  keys: arrows / h j k l / b w move, enter confirms, esc q backspace exit
*/
class Menu {
public:
    // Throws std::invalid_argument when `options` is empty.
    Menu(std::vector<MenuOption> options,
         MenuProps props = default_menu_props(),
         std::shared_ptr<Terminal> terminal = Terminal::standard());

    // Runs one interactive session until an exit key, or a confirm when
    // exit_on_action is set. Each call re-measures the terminal.
    void show();

    const std::vector<MenuOption>& options() const { return options_; }
    const MenuProps& props() const { return props_; }
    const MenuStyle& style() const { return style_; }
    const MenuLayout::Metrics& metrics() const { return metrics_; }
    const MenuNavigator& navigator() const { return navigator_; }

private:
    class Session;

    void refresh_layout();
    void run_navigation(MenuLogger& logger, Session& session);
    void draw() const;

private:
    std::vector<MenuOption>   options_;
    MenuProps                 props_;
    MenuStyle                 style_;
    std::shared_ptr<Terminal> terminal_;
    MenuLayout::Metrics       metrics_;
    MenuNavigator             navigator_;
};
