#pragma once

#include <string>
#include "utils/terminal.hpp"

/*
  turns raw tty bytes into KeyEvents
  handles CSI/SS3 arrow sequences, lone ESC, utf-8 multibyte input
*/
class KeyDecoder {
public:
    enum class Status { COMPLETE, NEED_MORE };

    static constexpr char ESC = '\x1b';
    static constexpr std::size_t MAX_SEQUENCE = 16;

    // Whether `pending` already holds one full key. A lone ESC reports
    // NEED_MORE; the caller decides by timeout whether more bytes follow.
    static Status status(const std::string& pending);
    static KeyEvent decode(const std::string& sequence);

private:
    static std::size_t utf8_length(unsigned char lead);
    static bool is_csi_final(unsigned char c);
};
