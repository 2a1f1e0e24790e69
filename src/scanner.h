// scanner.h - Finds structural markers while resolving escapes
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "syntax.h"

namespace tagstyle {

struct Tag {
    enum class Kind {
        OPEN,
        CLOSE,
    };

    Kind kind;
    size_t index;        // in the working buffer
    size_t source_index; // in the scanned source
};

// Copies `source` into `buffer` up to and including each structural marker.
// A run of n escape characters before a marker becomes n/2 literal escapes;
// an odd run makes the marker itself literal. Escapes elsewhere are copied.
class TagScanner {
public:
    TagScanner(std::string_view source, std::string& buffer) : source_(source), buffer_(buffer) {}

    // Next unescaped marker, or nullopt once the source is exhausted
    std::optional<Tag> next();

    // Offset of the next unread source character
    size_t source_offset() const { return pos_; }

private:
    std::string_view source_;
    std::string& buffer_;
    size_t pos_ = 0;

    size_t escape_run() const;
};

// Implementation

inline size_t TagScanner::escape_run() const {
    size_t end = pos_;
    while (end < source_.size() && source_[end] == syntax::ESCAPE_CHAR) {
        ++end;
    }
    return end - pos_;
}

inline std::optional<Tag> TagScanner::next() {
    while (pos_ < source_.size()) {
        const char c = source_[pos_];

        if (c == syntax::ESCAPE_CHAR) {
            const size_t run = escape_run();
            const size_t after = pos_ + run;

            if (after >= source_.size() || !syntax::is_marker(source_[after])) {
                buffer_.append(source_.substr(pos_, run));
                pos_ = after;
                continue;
            }

            buffer_.append(run / 2, syntax::ESCAPE_CHAR);
            pos_ = after;
            if (run % 2 == 1) {
                buffer_ += source_[pos_++]; // literal marker
            }
            continue;
        }

        if (syntax::is_marker(c)) {
            Tag tag{c == syntax::OPEN_MARKER ? Tag::Kind::OPEN : Tag::Kind::CLOSE, buffer_.size(), pos_};
            buffer_ += c;
            ++pos_;
            return tag;
        }

        buffer_ += c;
        ++pos_;
    }
    return std::nullopt;
}

} // namespace tagstyle
