#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/menu_option.hpp"
#include "utils/terminal.hpp"

struct MenuProps;

/*
  pagination and box geometry
  all results are clamped so tiny terminals never underflow
*/
class MenuLayout {
 public:
  static constexpr int DEFAULT_RESERVED_ROWS = 6;
  // two spaces of padding each side of the widest text
  static constexpr std::size_t BOX_PADDING = 4;

  struct Metrics {
    std::size_t options_per_page = 1;
    std::size_t page_count       = 1;
    std::size_t max_width        = 0;
  };

  static std::size_t options_per_page(int terminal_rows,
                                      std::size_t option_count,
                                      int reserved_rows = DEFAULT_RESERVED_ROWS);
  static std::size_t page_count(std::size_t option_count, std::size_t options_per_page);

  // Inclusive index bounds of `page`.
  static std::size_t page_start(std::size_t page, std::size_t options_per_page);
  static std::size_t page_end(std::size_t page,
                              std::size_t options_per_page,
                              std::size_t option_count);

  // Widest of every label, the title and the message; empty ones are skipped.
  static std::size_t max_width(const std::vector<MenuOption>& options,
                               const std::string& title,
                               const std::string& message);

  // "Page {page+1} of {page_count}"
  static std::string page_indicator(std::size_t page, std::size_t page_count);

  static std::size_t box_width(std::size_t max_width);
  static std::size_t indent(int terminal_cols, std::size_t max_width);
  static std::size_t vertical_pad(int terminal_rows, std::size_t frame_lines);

  // max_width is widened to the page indicator when there is more than one page
  static Metrics compute(const std::vector<MenuOption>& options,
                         const MenuProps& props,
                         const TerminalSize& size);
};
