// phrase.h - Parsed tagged region and the document holding them
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tagstyle {

// A phrase owns no text. Its content is buffer[open_index + 1, close_index)
// of the Document it belongs to, so nested phrases cost memory linear in the
// markup size.
struct Phrase {
    static constexpr size_t npos = static_cast<size_t>(-1);

    size_t open_index   = npos;  // opening marker, in the document buffer
    size_t close_index  = npos;  // closing marker, in the document buffer
    size_t source_index = npos;  // opening marker, in the original markup

    std::optional<std::string> style_code; // set once by StyleResolver

    std::vector<Phrase> children;
    std::vector<long long> arguments; // positional slots named by <text<0,1>>
    bool override_always = false;     // <text<0!>> ignores the always mapping

    Phrase() = default;
    Phrase(Phrase&&) noexcept = default;
    Phrase& operator=(Phrase&&) noexcept = default;
    Phrase(const Phrase&) = delete;
    Phrase& operator=(const Phrase&) = delete;
    ~Phrase();

    bool closed() const { return close_index != npos; }
    size_t size() const { return close_index - open_index - 1; }
};

// Escape-resolved working buffer and the top-level phrases indexing into it
struct Document {
    std::string buffer;
    std::vector<Phrase> phrases;

    std::string_view text_of(const Phrase& phrase) const {
        return std::string_view(buffer).substr(phrase.open_index + 1, phrase.size());
    }
};

// Implementation

// Descendants are released from an explicit stack, so tearing down a deeply
// nested tree does not recurse once per level.
inline Phrase::~Phrase() {
    if (children.empty()) return;

    std::vector<Phrase> pending = std::move(children);
    while (!pending.empty()) {
        Phrase last = std::move(pending.back());
        pending.pop_back();
        for (Phrase& child : last.children) {
            pending.push_back(std::move(child));
        }
        last.children.clear();
    }
}

} // namespace tagstyle
