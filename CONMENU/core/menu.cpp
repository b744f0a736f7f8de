#include "menu.hpp"

#include "core/menu_logger.hpp"
#include "render/ansi.hpp"
#include "render/menu_renderer.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {
// show() calls currently on the stack; failures are logged by the outermost
int g_open_sessions = 0;
} // namespace

// Owns the terminal state of one show() call: raw input and a hidden cursor.
// close() hands the screen back; unwinding without close() restores the
// cursor, colors and tty mode.
class Menu::Session {
public:
	explicit Session(Terminal& terminal) : terminal_(terminal) {
		terminal_.enter_raw_mode();
		terminal_.hide_cursor();
		++g_open_sessions;
	}
	~Session() {
		--g_open_sessions;
		if (closed_) return;
		try {
			terminal_.write_str(Ansi::reset_fg() + Ansi::reset_bg());
			terminal_.show_cursor();
			terminal_.flush();
		} catch (const std::exception& ex) {
			std::cerr << "[Menu] failed to restore cursor: " << ex.what() << "\n";
		}
		terminal_.leave_raw_mode();
	}
	void close() {
		terminal_.write_str(Ansi::clear_screen());
		terminal_.show_cursor();
		terminal_.flush();
		terminal_.leave_raw_mode();
		closed_ = true;
	}
	Session(const Session&) = delete;
	Session& operator=(const Session&) = delete;
private:
	Terminal& terminal_;
	bool closed_ = false;
};

Menu::Menu(std::vector<MenuOption> options, MenuProps props, std::shared_ptr<Terminal> terminal)
: options_(std::move(options)),
  props_(std::move(props)),
  style_(MenuStyle::resolve(props_)),
  terminal_(std::move(terminal))
{
	if (options_.empty()) throw std::invalid_argument("[Menu] menu options cannot be empty");
	if (!terminal_) throw std::invalid_argument("[Menu] terminal driver is null");
	refresh_layout();
}

void Menu::refresh_layout() {
	metrics_ = MenuLayout::compute(options_, props_, terminal_->size());
	navigator_.reset(options_.size(), metrics_.options_per_page);
}

void Menu::show() {
	const bool outermost = g_open_sessions == 0;
	try {
		refresh_layout();
		MenuLogger logger(props_.log_path);
		logger.log_open(options_.size(), metrics_.page_count);

		Session session(*terminal_);
		const TerminalSize size = terminal_->size();
		// push earlier output up so the box does not overlap it
		if (size.rows > 1) terminal_->write_str(std::string(static_cast<std::size_t>(size.rows - 1), '\n'));
		draw();
		logger.start_timer();
		run_navigation(logger, session);
	} catch (const std::exception& ex) {
		if (outermost) std::cerr << "[Menu] session aborted: " << ex.what() << "\n";
		throw;
	}
}

void Menu::run_navigation(MenuLogger& logger, Session& session) {
	while (true) {
		const KeyEvent key = terminal_->read_key();
		switch (navigator_.handle_key(key)) {
		case MenuNavigator::Outcome::EXIT:
			logger.log_exit(navigator_.selected_page(), navigator_.selected_option());
			session.close();
			return;
		case MenuNavigator::Outcome::CONFIRM: {
			MenuOption& option = options_[navigator_.selected_option()];
			logger.log_confirm(navigator_.selected_page(), navigator_.selected_option(), option.label);
			if (props_.exit_on_action) {
				// leave a clean screen for whatever the action prints
				session.close();
				option.action();
				return;
			}
			option.action();
			// a nested menu may have cleared the screen and shown the cursor
			terminal_->hide_cursor();
			break;
		}
		case MenuNavigator::Outcome::MOVED:
		case MenuNavigator::Outcome::NONE:
			break;
		}
		draw();
	}
}

void Menu::draw() const {
	MenuRenderer renderer(options_, props_, style_);
	renderer.draw(*terminal_, navigator_, metrics_);
}
