// === File: ui/colors.hpp ===
#pragma once

#include <cstdint>

// ---------- 8-bit palette ----------
// Indices 0-15 follow the user's terminal theme; the rest are fixed.
class Colors {
public:
    static constexpr std::uint8_t WHITE      = 15;
    static constexpr std::uint8_t LIGHT_GRAY = 7;
    static constexpr std::uint8_t GRAY       = 8;
    static constexpr std::uint8_t BLUE       = 32;
    static constexpr std::uint8_t GREEN      = 35;
    static constexpr std::uint8_t PURPLE     = 99;
    static constexpr std::uint8_t RED        = 160;
    static constexpr std::uint8_t ORANGE     = 208;
    static constexpr std::uint8_t YELLOW     = 220;
    static constexpr std::uint8_t BLACK      = 233;
    static constexpr std::uint8_t DARK_GRAY  = 236;

    // Looks up a palette entry by lowercase name ("dark_gray"); -1 if unknown.
    static int by_name(const char* name);
};
