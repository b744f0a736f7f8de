#include "posix_terminal.hpp"
#include "utils/input.hpp"
#include "render/ansi.hpp"

#include <cerrno>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace {

[[noreturn]] void throw_errno(const char* what) {
    throw std::system_error(errno, std::generic_category(), what);
}

// Keeps raw mode for the duration of one read when no session holds it.
class RawModeScope {
public:
    explicit RawModeScope(Terminal& terminal) : terminal_(terminal) { terminal_.enter_raw_mode(); }
    ~RawModeScope() { terminal_.leave_raw_mode(); }
    RawModeScope(const RawModeScope&) = delete;
    RawModeScope& operator=(const RawModeScope&) = delete;

private:
    Terminal& terminal_;
};

} // namespace

std::shared_ptr<Terminal> Terminal::standard() {
    static std::shared_ptr<Terminal> instance = std::make_shared<PosixTerminal>(STDIN_FILENO, STDOUT_FILENO);
    return instance;
}

PosixTerminal::PosixTerminal(int in_fd, int out_fd)
: in_fd_(in_fd), out_fd_(out_fd) {}

PosixTerminal::~PosixTerminal() {
    restore_mode();
    if (buffer_.empty()) return;
    try {
        flush();
    } catch (const std::exception& ex) {
        std::cerr << "[PosixTerminal] flush on close failed: " << ex.what() << "\n";
    }
}

void PosixTerminal::enter_raw_mode() {
    if (raw_depth_++ > 0 || !isatty(in_fd_)) return;
    if (tcgetattr(in_fd_, &saved_) != 0) {
        --raw_depth_;
        throw_errno("tcgetattr");
    }
    termios raw = saved_;
    // ISIG off: ctrl-c arrives as a byte so the tty can be restored first
    raw.c_lflag &= ~(ECHO | ICANON | ISIG);
    raw.c_cc[VMIN]  = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(in_fd_, TCSADRAIN, &raw) != 0) {
        --raw_depth_;
        throw_errno("tcsetattr");
    }
    raw_active_ = true;
}

void PosixTerminal::leave_raw_mode() {
    if (raw_depth_ == 0) return;
    if (--raw_depth_ == 0) restore_mode();
}

void PosixTerminal::restore_mode() {
    if (!raw_active_) return;
    raw_active_ = false;
    if (tcsetattr(in_fd_, TCSADRAIN, &saved_) != 0) {
        std::cerr << "[PosixTerminal] failed to restore tty mode (errno " << errno << ")\n";
    }
}

void PosixTerminal::interrupt() {
    buffer_ += Ansi::reset_fg() + Ansi::reset_bg();
    if (cursor_hidden_) show_cursor();
    try {
        flush();
    } catch (const std::exception& ex) {
        std::cerr << "[PosixTerminal] flush on interrupt failed: " << ex.what() << "\n";
    }
    restore_mode();
    std::raise(SIGINT);
    throw std::system_error(EINTR, std::generic_category(), "[PosixTerminal] interrupted");
}

TerminalSize PosixTerminal::size() const {
    winsize ws{};
    if (ioctl(out_fd_, TIOCGWINSZ, &ws) != 0) throw_errno("ioctl(TIOCGWINSZ)");
    TerminalSize sz;
    // some pseudo terminals report 0x0; keep the classic 24x80 then
    if (ws.ws_row > 0) sz.rows = ws.ws_row;
    if (ws.ws_col > 0) sz.cols = ws.ws_col;
    return sz;
}

int PosixTerminal::read_byte() {
    unsigned char c = 0;
    while (true) {
        const ssize_t n = ::read(in_fd_, &c, 1);
        if (n == 1) return c;
        if (n == 0) throw std::runtime_error("[PosixTerminal] input closed");
        if (errno != EINTR) throw_errno("read");
    }
}

bool PosixTerminal::byte_ready(int timeout_ms) const {
    pollfd pfd{ in_fd_, POLLIN, 0 };
    while (true) {
        const int rc = ::poll(&pfd, 1, timeout_ms);
        if (rc >= 0) return rc > 0 && (pfd.revents & POLLIN);
        if (errno != EINTR) throw_errno("poll");
    }
}

KeyEvent PosixTerminal::read_key() {
    RawModeScope raw(*this);
    std::string pending;
    pending.push_back(static_cast<char>(read_byte()));
    while (KeyDecoder::status(pending) == KeyDecoder::Status::NEED_MORE) {
        if (pending.size() == 1 && pending[0] == KeyDecoder::ESC && !byte_ready(ESCAPE_TIMEOUT_MS)) {
            break;
        }
        pending.push_back(static_cast<char>(read_byte()));
    }
    const KeyEvent key = KeyDecoder::decode(pending);
    if (key.key == Key::INTERRUPT) interrupt();
    return key;
}

void PosixTerminal::write_str(const std::string& s) {
    buffer_ += s;
}

void PosixTerminal::hide_cursor() {
    buffer_ += Ansi::hide_cursor();
    cursor_hidden_ = true;
}

void PosixTerminal::show_cursor() {
    buffer_ += Ansi::show_cursor();
    cursor_hidden_ = false;
}

void PosixTerminal::flush() {
    std::string out;
    out.swap(buffer_);
    write_all(out.data(), out.size());
}

void PosixTerminal::write_all(const char* data, std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        const ssize_t n = ::write(out_fd_, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw_errno("write");
        }
        written += static_cast<std::size_t>(n);
    }
}
