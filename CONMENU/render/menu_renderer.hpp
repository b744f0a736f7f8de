#pragma once

#include <string>
#include <vector>

#include "core/menu_option.hpp"
#include "core/menu_props.hpp"
#include "core/menu_navigator.hpp"
#include "layout/menu_layout.hpp"
#include "utils/terminal.hpp"

// Builds and writes one full frame of a menu. Stateless between frames, so
// drawing the same state twice produces the same bytes.
class MenuRenderer {
public:
    MenuRenderer(const std::vector<MenuOption>& options, const MenuProps& props);
    // Draws with an already resolved style instead of resolving `props`.
    MenuRenderer(const std::vector<MenuOption>& options, const MenuProps& props, const MenuStyle& style);

    // Box rows of the frame, indentation included, without newlines.
    std::vector<std::string> frame_lines(const MenuNavigator& nav,
                                         const MenuLayout::Metrics& metrics,
                                         const TerminalSize& size) const;

    // Every byte draw() would write for this state.
    std::string frame(const MenuNavigator& nav,
                      const MenuLayout::Metrics& metrics,
                      const TerminalSize& size) const;

    // Clears, writes the frame and flushes once.
    void draw(Terminal& terminal,
              const MenuNavigator& nav,
              const MenuLayout::Metrics& metrics) const;

    const MenuStyle& style() const { return style_; }

private:
    std::string prologue(const TerminalSize& size, std::size_t line_count) const;
    std::string epilogue() const;

    std::string blank_bar(std::size_t width) const;
    std::string title_row(std::size_t width) const;
    std::string option_row(const MenuOption& option, bool selected, std::size_t width) const;
    std::string page_row(const MenuNavigator& nav, std::size_t width) const;
    std::string message_row(std::size_t width) const;

private:
    const std::vector<MenuOption>& options_;
    const MenuProps& props_;
    MenuStyle style_;
};
