// ansi.h - ANSI escape sequence constants and SGR sequence builder
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tagstyle::ansi {

// SGR (Select Graphic Rendition) hard reset
constexpr int RESET = 0;

// Escape sequence delimiters
constexpr std::string_view ESC_START = "\033[";
constexpr char             ESC_END   = 'm';
constexpr char             SEP       = ';';

// Typical sequence: "\033[" + a few codes + "0;" + "m"
constexpr size_t MAX_SEQ_LEN = 48;

// "\033[<codes>m", activates a style
inline std::string start(std::string_view codes) {
    std::string result;
    result.reserve(ansi::MAX_SEQ_LEN);
    result = ESC_START;
    result += codes;
    result += ESC_END;
    return result;
}

// "\033[0;<codes>m", hard reset fused with the style to fall back to
inline std::string reset_to(std::string_view codes) {
    std::string result;
    result.reserve(ansi::MAX_SEQ_LEN);
    result = ESC_START;
    result += std::to_string(RESET);
    result += SEP;
    result += codes;
    result += ESC_END;
    return result;
}

} // namespace tagstyle::ansi
