#pragma once

#include <cstdint>
#include <string>

/*
  ANSI control sequences used by the menu
  every "on" helper wraps its text with the matching "off"
*/
class Ansi {
public:
    static std::string clear_screen();
    static std::string hide_cursor();
    static std::string show_cursor();

    static std::string fg(std::uint8_t color);
    static std::string bg(std::uint8_t color);
    static std::string reset_fg();
    static std::string reset_bg();

    static std::string bold(const std::string& s);
    static std::string underline(const std::string& s);
    // Colors `s` with `color`, then switches back to `restore`.
    static std::string switch_fg(const std::string& s, std::uint8_t color, std::uint8_t restore);

    // Background-filled cell of exactly `width` visible columns. `text` may
    // already carry decoration; padding is computed from its visible part.
    static std::string field(const std::string& text, std::size_t width, std::uint8_t bg_color);

    static std::string strip(const std::string& s);
    // Code points left after stripping control sequences.
    static std::size_t visible_length(const std::string& s);
};
