#include "menu_layout.hpp"

#include <algorithm>
#include "core/menu_props.hpp"
#include "render/ansi.hpp"

std::size_t MenuLayout::options_per_page(int terminal_rows,
                                         std::size_t option_count,
                                         int reserved_rows) {
  const long long available = static_cast<long long>(terminal_rows) - reserved_rows;
  const long long upper = static_cast<long long>(std::max<std::size_t>(option_count, 1));
  return static_cast<std::size_t>(std::clamp<long long>(available, 1, upper));
}

std::size_t MenuLayout::page_count(std::size_t option_count, std::size_t options_per_page) {
  if (option_count == 0 || options_per_page == 0) return 1;
  return ((option_count - 1) / options_per_page) + 1;
}

std::size_t MenuLayout::page_start(std::size_t page, std::size_t options_per_page) {
  return page * options_per_page;
}

std::size_t MenuLayout::page_end(std::size_t page,
                                 std::size_t options_per_page,
                                 std::size_t option_count) {
  const std::size_t start = page_start(page, options_per_page);
  const std::size_t end = std::min(start + options_per_page, option_count);
  return end == 0 ? 0 : end - 1;
}

std::size_t MenuLayout::max_width(const std::vector<MenuOption>& options,
                                  const std::string& title,
                                  const std::string& message) {
  std::size_t widest = 0;
  for (const auto& option : options) {
    widest = std::max(widest, Ansi::visible_length(option.label));
  }
  if (!title.empty()) widest = std::max(widest, Ansi::visible_length(title));
  if (!message.empty()) widest = std::max(widest, Ansi::visible_length(message));
  return widest;
}

std::string MenuLayout::page_indicator(std::size_t page, std::size_t page_count) {
  return "Page " + std::to_string(page + 1) + " of " + std::to_string(page_count);
}

std::size_t MenuLayout::box_width(std::size_t max_width) {
  return max_width + BOX_PADDING;
}

std::size_t MenuLayout::indent(int terminal_cols, std::size_t max_width) {
  const std::size_t half_cols = terminal_cols > 0 ? static_cast<std::size_t>(terminal_cols) / 2 : 0;
  const std::size_t half_box = box_width(max_width) / 2;
  return half_cols > half_box ? half_cols - half_box : 0;
}

std::size_t MenuLayout::vertical_pad(int terminal_rows, std::size_t frame_lines) {
  const std::size_t half_rows = terminal_rows > 0 ? static_cast<std::size_t>(terminal_rows) / 2 : 0;
  const std::size_t half_frame = frame_lines / 2;
  return half_rows > half_frame ? half_rows - half_frame : 0;
}

MenuLayout::Metrics MenuLayout::compute(const std::vector<MenuOption>& options,
                                        const MenuProps& props,
                                        const TerminalSize& size) {
  Metrics m;
  m.options_per_page = options_per_page(size.rows, options.size(), props.reserved_rows);
  m.page_count = page_count(options.size(), m.options_per_page);
  m.max_width = max_width(options, props.title, props.message);
  if (m.page_count > 1) {
    // the page indicator row has to fit inside the box too
    m.max_width = std::max(m.max_width, page_indicator(m.page_count - 1, m.page_count).size());
  }
  return m;
}
