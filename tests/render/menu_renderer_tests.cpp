#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

#include "render/menu_renderer.hpp"
#include "render/ansi.hpp"
#include "support/scripted_terminal.hpp"

#include <string>
#include <vector>

namespace {
std::vector<MenuOption> labels(const std::vector<std::string>& names) {
    std::vector<MenuOption> options;
    for (const auto& n : names) options.emplace_back(n, [] {});
    return options;
}

TerminalSize term_size(int rows, int cols) {
    TerminalSize s;
    s.rows = rows;
    s.cols = cols;
    return s;
}

std::size_t count_of(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
    return n;
}

std::string trim_indent(const std::string& line) {
    return line.substr(line.find_first_not_of(' '));
}
}

TEST_CASE("Every row has the same visible width whatever its decoration") {
    auto options = labels({"short", "a considerably longer label", "mid size"});
    MenuProps props = default_menu_props();
    props.title = "Title";
    props.message = "footer";
    props.title_color = 220;
    props.selected_color = 160;
    const TerminalSize size = term_size(40, 100);
    const auto metrics = MenuLayout::compute(options, props, size);
    const std::size_t expected = MenuLayout::box_width(metrics.max_width);
    const std::size_t indent = MenuLayout::indent(size.cols, metrics.max_width);

    MenuRenderer renderer(options, props);
    MenuNavigator nav(options.size(), metrics.options_per_page);
    for (std::size_t selected = 0; selected < options.size(); ++selected) {
        const auto rows = renderer.frame_lines(nav, metrics, size);
        for (const auto& row : rows) {
            INFO("row: " << Ansi::strip(row));
            CHECK_EQ(Ansi::visible_length(row), indent + expected);
        }
        nav.apply(MenuNavigator::Command::DOWN);
    }
}

TEST_CASE("Single-digit and triple-digit colors keep the box rectangular") {
    auto options = labels({"one", "two"});
    for (int color : {0, 7, 15, 99, 255}) {
        MenuProps props = default_menu_props();
        props.title = "T";
        props.fg_color = static_cast<std::uint8_t>(color);
        props.selected_color = static_cast<std::uint8_t>(255 - color);
        const auto metrics = MenuLayout::compute(options, props, term_size(20, 40));
        MenuRenderer renderer(options, props);
        MenuNavigator nav(options.size(), metrics.options_per_page);
        const auto rows = renderer.frame_lines(nav, metrics, term_size(20, 40));
        for (const auto& row : rows) {
            CHECK_EQ(Ansi::visible_length(trim_indent(row)), MenuLayout::box_width(metrics.max_width));
        }
    }
}

TEST_CASE("Drawing the same state twice writes identical bytes") {
    auto options = labels({"alpha", "beta", "gamma", "delta", "epsilon"});
    MenuProps props = default_menu_props();
    props.title = "Greek";
    ScriptedTerminal term(term_size(8, 60));
    const auto metrics = MenuLayout::compute(options, props, term.size());
    MenuRenderer renderer(options, props);
    MenuNavigator nav(options.size(), metrics.options_per_page);
    nav.apply(MenuNavigator::Command::DOWN);

    renderer.draw(term, nav, metrics);
    renderer.draw(term, nav, metrics);
    REQUIRE_EQ(term.flushes().size(), 2);
    CHECK_EQ(term.flushes()[0], term.flushes()[1]);
    CHECK_EQ(term.flushes()[0], renderer.frame(nav, metrics, term.size()));
}

TEST_CASE("Frame layout: bars, title, options, page indicator and footer") {
    auto options = labels({"a", "b", "c", "d", "e"});
    MenuProps props = default_menu_props();
    props.title = "Menu";
    props.message = "bye";
    const TerminalSize size = term_size(8, 30);  // two options per page
    const auto metrics = MenuLayout::compute(options, props, size);
    REQUIRE_EQ(metrics.options_per_page, 2);
    MenuRenderer renderer(options, props);
    MenuNavigator nav(options.size(), metrics.options_per_page);
    nav.apply(MenuNavigator::Command::NEXT_PAGE);

    const auto rows = renderer.frame_lines(nav, metrics, size);
    REQUIRE_EQ(rows.size(), 9);
    std::vector<std::string> visible;
    for (const auto& r : rows) visible.push_back(Ansi::strip(trim_indent(r)));
    // widest text is the page indicator, so the box is 11 + 4 wide
    REQUIRE_EQ(metrics.max_width, 11);
    const auto padded = [](const std::string& text) {
        std::string s = text.empty() ? std::string() : "  " + text;
        return s + std::string(15 - s.size(), ' ');
    };
    CHECK_EQ(visible[0], padded(""));
    CHECK_EQ(visible[1], padded("Menu"));
    CHECK_EQ(visible[2], padded(""));
    CHECK_EQ(visible[3], padded("c"));
    CHECK_EQ(visible[4], padded("d"));
    CHECK_EQ(visible[5], padded("Page 2 of 3"));
    CHECK_EQ(visible[6], padded(""));
    CHECK_EQ(visible[7], padded("bye"));
    CHECK_EQ(visible[8], padded(""));
}

TEST_CASE("No page indicator on a single page and no title or footer rows when empty") {
    auto options = labels({"x", "y"});
    const auto metrics = MenuLayout::compute(options, default_menu_props(), term_size(24, 80));
    MenuRenderer renderer(options, default_menu_props());
    MenuNavigator nav(options.size(), metrics.options_per_page);
    const auto rows = renderer.frame_lines(nav, metrics, term_size(24, 80));
    CHECK_EQ(rows.size(), 4);
    for (const auto& r : rows) CHECK_EQ(Ansi::strip(r).find("Page"), std::string::npos);
}

TEST_CASE("Selected option is bold in the selection color and switches back") {
    auto options = labels({"first", "second"});
    MenuProps props = default_menu_props();
    props.fg_color = 15;
    props.selected_color = 208;
    const auto metrics = MenuLayout::compute(options, props, term_size(24, 80));
    MenuRenderer renderer(options, props);
    MenuNavigator nav(options.size(), metrics.options_per_page);
    nav.apply(MenuNavigator::Command::DOWN);

    const auto rows = renderer.frame_lines(nav, metrics, term_size(24, 80));
    const std::string& first = rows[1];
    const std::string& second = rows[2];
    CHECK_EQ(first.find("\x1b[1m"), std::string::npos);
    CHECK_NE(second.find("\x1b[38;5;208m\x1b[1msecond\x1b[22m\x1b[38;5;15m"), std::string::npos);
}

TEST_CASE("Title is bold and underlined in the title color") {
    auto options = labels({"x"});
    MenuProps props = default_menu_props();
    props.title = "Head";
    props.title_color = 32;
    const auto metrics = MenuLayout::compute(options, props, term_size(24, 80));
    MenuRenderer renderer(options, props);
    MenuNavigator nav(1, 1);
    const auto rows = renderer.frame_lines(nav, metrics, term_size(24, 80));
    CHECK_NE(rows[1].find("\x1b[38;5;32m\x1b[4m\x1b[1mHead\x1b[22m\x1b[24m\x1b[38;5;15m"), std::string::npos);
}

TEST_CASE("Every decoration that is switched on is switched off") {
    auto options = labels({"a", "b", "c"});
    MenuProps props = default_menu_props();
    props.title = "T";
    props.message = "M";
    const auto metrics = MenuLayout::compute(options, props, term_size(24, 80));
    MenuRenderer renderer(options, props);
    MenuNavigator nav(options.size(), metrics.options_per_page);
    const std::string frame = renderer.frame(nav, metrics, term_size(24, 80));

    CHECK_EQ(count_of(frame, "\x1b[1m"), count_of(frame, "\x1b[22m"));
    CHECK_EQ(count_of(frame, "\x1b[4m"), count_of(frame, "\x1b[24m"));
    CHECK_EQ(count_of(frame, "\x1b[48;5;"), count_of(frame, "\x1b[49m"));
    CHECK_EQ(frame.rfind(Ansi::clear_screen(), 0), 0);
    CHECK_EQ(frame.substr(frame.size() - Ansi::reset_fg().size()), Ansi::reset_fg());
}

TEST_CASE("Box is centered using the terminal size") {
    auto options = labels({"0123456789"});
    const TerminalSize size = term_size(21, 50);
    const auto metrics = MenuLayout::compute(options, default_menu_props(), size);
    MenuRenderer renderer(options, default_menu_props());
    MenuNavigator nav(1, 1);
    const std::string frame = renderer.frame(nav, metrics, size);
    const auto rows = renderer.frame_lines(nav, metrics, size);

    // 3 rows -> 10 - 1 blank lines above the box
    const std::string expected_prefix = Ansi::clear_screen() + std::string(9, '\n') + Ansi::fg(15);
    CHECK_EQ(frame.rfind(expected_prefix, 0), 0);
    // (50 / 2) - (14 / 2) = 18 columns of indent
    CHECK_EQ(rows[0].find_first_not_of(' '), 18);
}

TEST_CASE("A pre-resolved style is used as given") {
    auto options = labels({"one", "two"});
    const MenuProps props = default_menu_props();
    MenuStyle style = MenuStyle::resolve(props);
    style.bg = 1;
    style.fg = 2;
    const TerminalSize size = term_size(20, 60);
    const auto metrics = MenuLayout::compute(options, props, size);
    MenuNavigator nav(options.size(), metrics.options_per_page);

    MenuRenderer renderer(options, props, style);
    CHECK_EQ(renderer.style().bg, 1);
    const std::string frame = renderer.frame(nav, metrics, size);
    CHECK_NE(frame.find(Ansi::bg(1)), std::string::npos);
    CHECK_NE(frame.find(Ansi::fg(2)), std::string::npos);
    CHECK_EQ(frame.find(Ansi::bg(props.bg_color)), std::string::npos);
}
