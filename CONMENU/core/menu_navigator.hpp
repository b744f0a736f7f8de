#pragma once

#include <cstddef>
#include "utils/terminal.hpp"

// Selection/page state of a Menu and its key-driven transitions.
// Invariant: page_start() <= selected_option() <= page_end().
class MenuNavigator {
public:
    enum class Command {
        NONE = 0,
        UP,
        DOWN,
        PREV_PAGE,
        NEXT_PAGE,
        CONFIRM,
        EXIT
    };

    enum class Outcome {
        NONE = 0,   // nothing changed, still redraw
        MOVED,
        CONFIRM,
        EXIT
    };

    MenuNavigator() = default;
    MenuNavigator(std::size_t option_count, std::size_t options_per_page);

    // Re-paginates and returns to page 0, option 0.
    void reset(std::size_t option_count, std::size_t options_per_page);

    static Command command_for(const KeyEvent& key);
    Outcome handle_key(const KeyEvent& key);
    Outcome apply(Command cmd);

    // Jumps to `page` and selects its first option.
    void set_page(std::size_t page);

    std::size_t selected_option() const { return selected_option_; }
    std::size_t selected_page() const { return selected_page_; }
    std::size_t page_start() const { return page_start_; }
    std::size_t page_end() const { return page_end_; }
    std::size_t page_count() const { return page_count_; }
    std::size_t options_per_page() const { return options_per_page_; }
    std::size_t option_count() const { return option_count_; }
    bool on_last_page() const { return selected_page_ + 1 >= page_count_; }

private:
    bool move_up();
    bool move_down();
    bool prev_page();
    bool next_page();

private:
    std::size_t option_count_     = 1;
    std::size_t options_per_page_ = 1;
    std::size_t page_count_       = 1;
    std::size_t selected_option_  = 0;
    std::size_t selected_page_    = 0;
    std::size_t page_start_       = 0;
    std::size_t page_end_         = 0;
};
