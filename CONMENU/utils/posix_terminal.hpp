#pragma once

#include <string>
#include <termios.h>
#include "utils/terminal.hpp"

// Terminal driver over the controlling tty (termios + ANSI).
class PosixTerminal : public Terminal {
public:
    PosixTerminal(int in_fd, int out_fd);
    ~PosixTerminal() override;

    TerminalSize size() const override;
    // Ctrl-C hands the tty back (mode, colors, cursor) and raises SIGINT.
    // If a handler lets the process live on, throws std::system_error(EINTR).
    KeyEvent read_key() override;
    void write_str(const std::string& s) override;
    void hide_cursor() override;
    void show_cursor() override;
    void flush() override;

    void enter_raw_mode() override;
    void leave_raw_mode() override;

private:
    // ms to wait for the rest of an escape sequence before reporting ESC
    static constexpr int ESCAPE_TIMEOUT_MS = 50;

    int  read_byte();
    bool byte_ready(int timeout_ms) const;
    void write_all(const char* data, std::size_t len);
    void restore_mode();
    [[noreturn]] void interrupt();

private:
    int in_fd_  = 0;
    int out_fd_ = 1;
    std::string buffer_;

    termios saved_{};
    int  raw_depth_     = 0;
    bool raw_active_    = false;
    bool cursor_hidden_ = false;
};
