#include "menu_renderer.hpp"

#include "render/ansi.hpp"

MenuRenderer::MenuRenderer(const std::vector<MenuOption>& options, const MenuProps& props)
: MenuRenderer(options, props, MenuStyle::resolve(props)) {}

MenuRenderer::MenuRenderer(const std::vector<MenuOption>& options, const MenuProps& props, const MenuStyle& style)
: options_(options), props_(props), style_(style) {}

std::string MenuRenderer::blank_bar(std::size_t width) const {
	return Ansi::field("", width, style_.bg);
}

std::string MenuRenderer::title_row(std::size_t width) const {
	const std::string decorated = Ansi::underline(Ansi::bold(props_.title));
	return Ansi::field(Ansi::switch_fg(decorated, style_.title, style_.fg), width, style_.bg);
}

std::string MenuRenderer::option_row(const MenuOption& option, bool selected, std::size_t width) const {
	if (!selected) return Ansi::field(option.label, width, style_.bg);
	return Ansi::field(Ansi::switch_fg(Ansi::bold(option.label), style_.selected, style_.fg), width, style_.bg);
}

std::string MenuRenderer::page_row(const MenuNavigator& nav, std::size_t width) const {
	return Ansi::field(MenuLayout::page_indicator(nav.selected_page(), nav.page_count()), width, style_.bg);
}

std::string MenuRenderer::message_row(std::size_t width) const {
	return Ansi::field(Ansi::switch_fg(props_.message, style_.msg, style_.fg), width, style_.bg);
}

std::vector<std::string> MenuRenderer::frame_lines(const MenuNavigator& nav,
                                                   const MenuLayout::Metrics& metrics,
                                                   const TerminalSize& size) const {
	const std::size_t width = MenuLayout::box_width(metrics.max_width);
	const std::string indent(MenuLayout::indent(size.cols, metrics.max_width), ' ');

	std::vector<std::string> rows;
	rows.push_back(blank_bar(width));
	if (!props_.title.empty()) {
		rows.push_back(title_row(width));
		rows.push_back(blank_bar(width));
	}
	for (std::size_t i = nav.page_start(); i <= nav.page_end() && i < options_.size(); ++i) {
		rows.push_back(option_row(options_[i], i == nav.selected_option(), width));
	}
	if (nav.page_count() > 1) {
		rows.push_back(page_row(nav, width));
	}
	if (!props_.message.empty()) {
		rows.push_back(blank_bar(width));
		rows.push_back(message_row(width));
	}
	rows.push_back(blank_bar(width));

	for (auto& row : rows) row.insert(0, indent);
	return rows;
}

std::string MenuRenderer::prologue(const TerminalSize& size, std::size_t line_count) const {
	const std::size_t pad = MenuLayout::vertical_pad(size.rows, line_count);
	return Ansi::clear_screen() + std::string(pad, '\n') + Ansi::fg(style_.fg);
}

std::string MenuRenderer::epilogue() const {
	return Ansi::reset_fg();
}

std::string MenuRenderer::frame(const MenuNavigator& nav,
                                const MenuLayout::Metrics& metrics,
                                const TerminalSize& size) const {
	const auto rows = frame_lines(nav, metrics, size);
	std::string out = prologue(size, rows.size());
	for (const auto& row : rows) {
		out += row;
		out += '\n';
	}
	out += epilogue();
	return out;
}

void MenuRenderer::draw(Terminal& terminal,
                        const MenuNavigator& nav,
                        const MenuLayout::Metrics& metrics) const {
	const TerminalSize size = terminal.size();
	const auto rows = frame_lines(nav, metrics, size);
	terminal.write_str(prologue(size, rows.size()));
	for (const auto& row : rows) {
		terminal.write_line(row);
	}
	terminal.write_str(epilogue());
	terminal.flush();
}
