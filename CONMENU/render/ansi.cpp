#include "ansi.hpp"

namespace {
const std::string CSI = "\x1b[";

std::size_t utf8_code_points(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}
} // namespace

std::string Ansi::clear_screen() { return CSI + "H" + CSI + "J" + CSI + "H"; }
std::string Ansi::hide_cursor()  { return CSI + "?25l"; }
std::string Ansi::show_cursor()  { return CSI + "?25h"; }

std::string Ansi::fg(std::uint8_t color) {
    return CSI + "38;5;" + std::to_string(color) + "m";
}

std::string Ansi::bg(std::uint8_t color) {
    return CSI + "48;5;" + std::to_string(color) + "m";
}

std::string Ansi::reset_fg() { return CSI + "39m"; }
std::string Ansi::reset_bg() { return CSI + "49m"; }

std::string Ansi::bold(const std::string& s) {
    return CSI + "1m" + s + CSI + "22m";
}

std::string Ansi::underline(const std::string& s) {
    return CSI + "4m" + s + CSI + "24m";
}

std::string Ansi::switch_fg(const std::string& s, std::uint8_t color, std::uint8_t restore) {
    return fg(color) + s + fg(restore);
}

std::string Ansi::field(const std::string& text, std::size_t width, std::uint8_t bg_color) {
    std::string body = "  " + text;
    const std::size_t visible = visible_length(body);
    if (visible < width) body.append(width - visible, ' ');
    return bg(bg_color) + body + reset_bg();
}

std::string Ansi::strip(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '\x1b' && i + 1 < s.size() && s[i + 1] == '[') {
            i += 2;
            while (i < s.size() && !(s[i] >= 0x40 && s[i] <= 0x7E)) ++i;
            ++i; // final byte
            continue;
        }
        out.push_back(s[i]);
        ++i;
    }
    return out;
}

std::size_t Ansi::visible_length(const std::string& s) {
    return utf8_code_points(strip(s));
}
