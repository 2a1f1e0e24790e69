// position.h - Human readable positions and ordinals for diagnostics
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "errors.h"

namespace tagstyle {

// Describes where `index` lies in `text`. Single-line text yields the bare
// index, multi-line text yields "line:column" with both counted from 1.
inline std::string position(std::string_view text, size_t index) {
    if (index >= text.size()) {
        throw InternalError("Out-of-range index " + std::to_string(index) +
                            " passed to position() for text of length " +
                            std::to_string(text.size()) + "!");
    }

    if (text.find('\n') == std::string_view::npos) {
        return std::to_string(index);
    }

    size_t line       = 1;
    size_t line_start = 0;
    for (size_t i = 0; i < index; ++i) {
        if (text[i] == '\n') {
            ++line;
            line_start = i + 1;
        }
    }

    return std::to_string(line) + ":" + std::to_string(index - line_start + 1);
}

// Spoken ordinal with its article: 1 -> "a 1st", 11 -> "an 11th"
inline std::string ordinal(size_t n) {
    const std::string digits = std::to_string(n);

    // "an" before a spoken leading "eight", "eleven" or "eighteen"
    size_t lead = digits.size() % 3;
    if (lead == 0) lead = 3;
    const std::string group = digits.substr(0, lead);

    const bool vowel = digits.front() == '8' || group == "11" || group == "18";
    std::string result = vowel ? "an " : "a ";
    result += digits;

    const size_t last_two = n % 100;
    if (last_two >= 11 && last_two <= 13) {
        return result + "th";
    }
    switch (n % 10) {
    case 1:  return result + "st";
    case 2:  return result + "nd";
    case 3:  return result + "rd";
    default: return result + "th";
    }
}

} // namespace tagstyle
