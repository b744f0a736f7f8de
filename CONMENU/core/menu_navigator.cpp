#include "menu_navigator.hpp"

#include <algorithm>
#include "layout/menu_layout.hpp"

MenuNavigator::MenuNavigator(std::size_t option_count, std::size_t options_per_page) {
    reset(option_count, options_per_page);
}

void MenuNavigator::reset(std::size_t option_count, std::size_t options_per_page) {
    option_count_     = std::max<std::size_t>(option_count, 1);
    options_per_page_ = std::clamp<std::size_t>(options_per_page, 1, option_count_);
    page_count_       = MenuLayout::page_count(option_count_, options_per_page_);
    set_page(0);
}

void MenuNavigator::set_page(std::size_t page) {
    selected_page_   = std::min(page, page_count_ - 1);
    page_start_      = MenuLayout::page_start(selected_page_, options_per_page_);
    page_end_        = MenuLayout::page_end(selected_page_, options_per_page_, option_count_);
    selected_option_ = page_start_;
}

MenuNavigator::Command MenuNavigator::command_for(const KeyEvent& key) {
    switch (key.key) {
    case Key::ARROW_UP:    return Command::UP;
    case Key::ARROW_DOWN:  return Command::DOWN;
    case Key::ARROW_LEFT:  return Command::PREV_PAGE;
    case Key::ARROW_RIGHT: return Command::NEXT_PAGE;
    case Key::ENTER:       return Command::CONFIRM;
    case Key::ESCAPE:
    case Key::BACKSPACE:
    case Key::INTERRUPT:   return Command::EXIT;
    case Key::CHAR:
        switch (key.ch) {
        case 'k':           return Command::UP;
        case 'j':           return Command::DOWN;
        case 'h': case 'b': return Command::PREV_PAGE;
        case 'l': case 'w': return Command::NEXT_PAGE;
        case 'q':           return Command::EXIT;
        default:            return Command::NONE;
        }
    default:
        return Command::NONE;
    }
}

MenuNavigator::Outcome MenuNavigator::handle_key(const KeyEvent& key) {
    return apply(command_for(key));
}

MenuNavigator::Outcome MenuNavigator::apply(Command cmd) {
    bool moved = false;
    switch (cmd) {
    case Command::UP:        moved = move_up();   break;
    case Command::DOWN:      moved = move_down(); break;
    case Command::PREV_PAGE: moved = prev_page(); break;
    case Command::NEXT_PAGE: moved = next_page(); break;
    case Command::CONFIRM:   return Outcome::CONFIRM;
    case Command::EXIT:      return Outcome::EXIT;
    case Command::NONE:      break;
    }
    return moved ? Outcome::MOVED : Outcome::NONE;
}

bool MenuNavigator::move_up() {
    if (selected_option_ > page_start_) {
        --selected_option_;
        return true;
    }
    if (selected_page_ == 0) return false;
    // wrap to the bottom of the previous page
    set_page(selected_page_ - 1);
    selected_option_ = page_end_;
    return true;
}

bool MenuNavigator::move_down() {
    if (selected_option_ < page_end_) {
        ++selected_option_;
        return true;
    }
    if (on_last_page()) return false;
    set_page(selected_page_ + 1);
    return true;
}

bool MenuNavigator::prev_page() {
    if (selected_page_ == 0) return false;
    set_page(selected_page_ - 1);
    return true;
}

bool MenuNavigator::next_page() {
    if (on_last_page()) return false;
    set_page(selected_page_ + 1);
    return true;
}
