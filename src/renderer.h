// renderer.h - Interleaves document text with style codes
#pragma once

#include <cstddef>
#include <stack>
#include <string>
#include <string_view>
#include <vector>

#include "ansi.h"
#include "errors.h"
#include "phrase.h"

namespace tagstyle {

// Writes the document in order. Every phrase is wrapped in its start code and
// a reset that falls back to the enclosing phrase's style, so closing a
// nested phrase keeps the outer style active.
class Renderer {
public:
    explicit Renderer(const Document& document, bool strip = false) : document_(document), strip_(strip) {}

    // Throws InternalError if a phrase was never resolved (unless stripping)
    std::string render();

private:
    const Document& document_;
    const bool strip_; // drop markers without emitting codes

    // One nesting level of the walk
    struct Level {
        const std::vector<Phrase>* siblings;
        size_t next;
        const Phrase* parent;
    };

    std::string output_;
    size_t last_ = 0; // first buffer index not yet written

    void emit_ansi(const std::string& ansi) {
        if (!strip_) {
            output_ += ansi;
        }
    }

    void emit_text_until(size_t end) {
        output_.append(document_.buffer, last_, end - last_);
    }

    std::string_view code_of(const Phrase* phrase) const;
};

// Implementation

inline std::string_view Renderer::code_of(const Phrase* phrase) const {
    if (!phrase || strip_) return {};
    if (!phrase->style_code) {
        throw InternalError("Phrase '" + std::string(document_.text_of(*phrase)) +
                            "' reached the renderer without a style!");
    }
    return *phrase->style_code;
}

inline std::string Renderer::render() {
    if (document_.phrases.empty()) {
        return document_.buffer;
    }

    output_.clear();
    output_.reserve(document_.buffer.size() + 16 * document_.phrases.size());
    last_ = 0;

    std::stack<Level> levels;
    levels.push({&document_.phrases, 0, nullptr});

    while (!levels.empty()) {
        Level& level = levels.top();

        if (level.next < level.siblings->size()) {
            const Phrase& phrase = (*level.siblings)[level.next++];

            emit_text_until(phrase.open_index);
            emit_ansi(ansi::start(code_of(&phrase)));
            last_ = phrase.open_index + 1;

            levels.push({&phrase.children, 0, &phrase});
            continue;
        }

        const Phrase* closing = level.parent;
        levels.pop();
        if (!closing) break;

        emit_text_until(closing->close_index);
        emit_ansi(ansi::reset_to(code_of(levels.top().parent)));
        last_ = closing->close_index + 1;
    }

    emit_text_until(document_.buffer.size());
    return std::move(output_);
}

} // namespace tagstyle
