// syntax.h - Markup syntax constants
#pragma once

#include <string_view>

namespace tagstyle::syntax {

constexpr char OPEN_MARKER  = '<';
constexpr char CLOSE_MARKER = '>';
constexpr char ESCAPE_CHAR  = '\\';

// Argument specifier: <text<0,2!>>
constexpr char ARGUMENT_SEP = ',';
constexpr char NEGATIVE     = '-';
constexpr char OVERRIDE     = '!';

constexpr bool is_marker(char c) {
    return c == OPEN_MARKER || c == CLOSE_MARKER;
}

// Characters accepted as separators between flag names in a style spec
constexpr std::string_view FLAG_JOINERS = "+|";

} // namespace tagstyle::syntax
