#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

#include "ui/colors.hpp"

// Configuration handed to a Menu at construction. Start from the defaults
// and override the fields you need:
//
//   MenuProps props = default_menu_props();
//   props.title = "My Menu";
struct MenuProps {
    // Shown above the options; empty for no title.
    std::string title;
    // Footer shown below the options; empty for no message.
    std::string message;
    // Close the menu as soon as an option is confirmed.
    bool exit_on_action = true;
    std::uint8_t bg_color = Colors::GRAY;
    std::uint8_t fg_color = Colors::WHITE;
    // Unset overrides fall back to fg_color.
    std::optional<std::uint8_t> title_color;
    std::optional<std::uint8_t> selected_color;
    std::optional<std::uint8_t> msg_color = Colors::LIGHT_GRAY;
    // Rows kept free for borders, title, footer and padding.
    int reserved_rows = 6;
    // CSV session log; empty disables logging.
    std::string log_path;
};

// Colors after resolving the optional overrides.
struct MenuStyle {
    std::uint8_t bg       = Colors::GRAY;
    std::uint8_t fg       = Colors::WHITE;
    std::uint8_t title    = Colors::WHITE;
    std::uint8_t selected = Colors::WHITE;
    std::uint8_t msg      = Colors::WHITE;

    static MenuStyle resolve(const MenuProps& props);
};

MenuProps default_menu_props();

// Missing keys keep their default. Colors may be 0-255 or a palette name;
// anything else throws std::invalid_argument.
MenuProps menu_props_from_json(const nlohmann::json& j);
nlohmann::json menu_props_to_json(const MenuProps& props);

// File helpers; load throws std::runtime_error naming the file.
MenuProps load_menu_props(const std::string& path);
bool save_menu_props(const std::string& path, const MenuProps& props);
