#include "input.hpp"

namespace {
Key arrow_for(char final_byte) {
    switch (final_byte) {
    case 'A': return Key::ARROW_UP;
    case 'B': return Key::ARROW_DOWN;
    case 'C': return Key::ARROW_RIGHT;
    case 'D': return Key::ARROW_LEFT;
    default:  return Key::OTHER;
    }
}
} // namespace

std::size_t KeyDecoder::utf8_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

bool KeyDecoder::is_csi_final(unsigned char c) {
    return c >= 0x40 && c <= 0x7E;
}

KeyDecoder::Status KeyDecoder::status(const std::string& pending) {
    if (pending.empty()) return Status::NEED_MORE;
    if (pending.size() >= MAX_SEQUENCE) return Status::COMPLETE;

    const unsigned char lead = static_cast<unsigned char>(pending[0]);
    if (lead == static_cast<unsigned char>(ESC)) {
        if (pending.size() == 1) return Status::NEED_MORE;
        const char intro = pending[1];
        if (intro != '[' && intro != 'O') return Status::COMPLETE;
        if (pending.size() == 2) return Status::NEED_MORE;
        // SS3 is always a single final byte; CSI may carry parameters
        if (intro == 'O') return Status::COMPLETE;
        const unsigned char last = static_cast<unsigned char>(pending.back());
        return is_csi_final(last) ? Status::COMPLETE : Status::NEED_MORE;
    }
    return pending.size() >= utf8_length(lead) ? Status::COMPLETE : Status::NEED_MORE;
}

KeyEvent KeyDecoder::decode(const std::string& sequence) {
    if (sequence.empty()) return KeyEvent::of(Key::OTHER);

    const char first = sequence[0];
    if (first == ESC) {
        if (sequence.size() == 1) return KeyEvent::of(Key::ESCAPE);
        if (sequence.size() == 3 && (sequence[1] == '[' || sequence[1] == 'O')) {
            return KeyEvent::of(arrow_for(sequence[2]));
        }
        return KeyEvent::of(Key::OTHER);
    }
    if (sequence.size() != 1) return KeyEvent::of(Key::OTHER);

    switch (first) {
    case '\r':
    case '\n':
        return KeyEvent::of(Key::ENTER);
    case '\x7f':
    case '\b':
        return KeyEvent::of(Key::BACKSPACE);
    case '\x03':
        return KeyEvent::of(Key::INTERRUPT);
    default:
        break;
    }
    const unsigned char uc = static_cast<unsigned char>(first);
    if (uc >= 32 && uc < 127) return KeyEvent::character(first);
    return KeyEvent::of(Key::OTHER);
}
