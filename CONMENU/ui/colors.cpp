#include "colors.hpp"

#include <cstring>

namespace {
struct NamedColor {
    const char*  name;
    std::uint8_t value;
};

const NamedColor kPalette[] = {
    { "white",      Colors::WHITE },
    { "light_gray", Colors::LIGHT_GRAY },
    { "gray",       Colors::GRAY },
    { "blue",       Colors::BLUE },
    { "green",      Colors::GREEN },
    { "purple",     Colors::PURPLE },
    { "red",        Colors::RED },
    { "orange",     Colors::ORANGE },
    { "yellow",     Colors::YELLOW },
    { "black",      Colors::BLACK },
    { "dark_gray",  Colors::DARK_GRAY },
};
} // namespace

int Colors::by_name(const char* name) {
    if (!name) return -1;
    for (const auto& c : kPalette) {
        if (std::strcmp(c.name, name) == 0) return c.value;
    }
    return -1;
}
