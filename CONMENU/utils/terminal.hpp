#pragma once

#include <memory>
#include <string>

// Logical key categories delivered by a terminal driver.
enum class Key {
    ARROW_UP,
    ARROW_DOWN,
    ARROW_LEFT,
    ARROW_RIGHT,
    ENTER,
    ESCAPE,
    BACKSPACE,
    INTERRUPT,  // ctrl-c while the tty is in raw mode
    CHAR,
    OTHER
};

struct KeyEvent {
    Key  key = Key::OTHER;
    char ch  = 0;   // set only when key == Key::CHAR

    static KeyEvent of(Key k) { return KeyEvent{ k, 0 }; }
    static KeyEvent character(char c) { return KeyEvent{ Key::CHAR, c }; }
    bool is_char(char c) const { return key == Key::CHAR && ch == c; }
};

struct TerminalSize {
    int rows = 24;
    int cols = 80;
};

/*
  console driver used by Menu
  all writes are buffered until flush()
  every method may throw on I/O failure
*/
class Terminal {
public:
    virtual ~Terminal() = default;

    virtual TerminalSize size() const = 0;
    // Blocks until one logical key is available.
    virtual KeyEvent read_key() = 0;
    virtual void write_str(const std::string& s) = 0;
    virtual void write_line(const std::string& s) { write_str(s + "\n"); }
    virtual void hide_cursor() = 0;
    virtual void show_cursor() = 0;
    virtual void flush() = 0;

    // Raw (no echo, unbuffered, no signal keys) input for a whole session.
    // Calls nest; only the outermost leave restores the saved mode.
    virtual void enter_raw_mode() = 0;
    virtual void leave_raw_mode() = 0;

    // Shared driver bound to the process' stdin/stdout.
    static std::shared_ptr<Terminal> standard();
};
