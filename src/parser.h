// parser.h - Builds the phrase tree from tagged markup
#pragma once

#include <algorithm>
#include <charconv>
#include <climits>
#include <cstddef>
#include <stack>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "diagnostics.h"
#include "errors.h"
#include "phrase.h"
#include "position.h"
#include "scanner.h"
#include "syntax.h"

namespace tagstyle {

// Turns markup into a Document. Open phrases are kept on an explicit stack,
// so nesting depth is limited by memory only.
class PhraseTreeBuilder {
public:
    explicit PhraseTreeBuilder(Diagnostics* diagnostics = nullptr) : diagnostics_(diagnostics) {}

    // Throws ParseError if a phrase is still open when the markup ends
    Document build(std::string_view markup);

    // Matches "0", "1,2", "0,-3!", "4,!" and fills the out-parameters
    static bool parse_arguments(std::string_view content, std::vector<long long>& arguments, bool& override_always);

private:
    enum class State {
        SCANNING_TOP,
        SCANNING_PHRASE,
    };

    Diagnostics* diagnostics_;
    State state_ = State::SCANNING_TOP;
    std::string_view markup_;
    Document document_;
    std::stack<Phrase> frames_;

    void handle_open(const Tag& tag);
    void handle_close(const Tag& tag);
    void handle_orphan_close(const Tag& tag);
    void attach(Phrase phrase);
    [[noreturn]] void fail_unclosed() const;
};

// Implementation

inline Document PhraseTreeBuilder::build(std::string_view markup) {
    markup_   = markup;
    document_ = Document{};
    frames_   = std::stack<Phrase>();
    state_    = State::SCANNING_TOP;

    document_.buffer.reserve(markup.size());
    TagScanner scanner(markup, document_.buffer);

    while (auto tag = scanner.next()) {
        if (tag->kind == Tag::Kind::OPEN) {
            handle_open(*tag);
            continue;
        }

        switch (state_) {
        case State::SCANNING_PHRASE:
            handle_close(*tag);
            break;
        case State::SCANNING_TOP:
        default:
            handle_orphan_close(*tag);
            break;
        }
    }

    if (state_ == State::SCANNING_PHRASE) {
        fail_unclosed();
    }

    if (diagnostics_) {
        diagnostics_->trace("Parsed {} top-level phrase(s) from {} characters", document_.phrases.size(),
                            markup.size());
    }
    return std::move(document_);
}

inline void PhraseTreeBuilder::handle_open(const Tag& tag) {
    Phrase phrase;
    phrase.open_index   = tag.index;
    phrase.source_index = tag.source_index;
    frames_.push(std::move(phrase));
    state_ = State::SCANNING_PHRASE;
}

inline void PhraseTreeBuilder::handle_close(const Tag& tag) {
    Phrase& frame      = frames_.top();
    const size_t begin = frame.open_index + 1;
    const std::string_view content(document_.buffer.data() + begin, tag.index - begin);

    if (frame.children.empty()) {
        std::vector<long long> arguments;
        bool override_always = false;
        if (parse_arguments(content, arguments, override_always)) {
            if (frames_.size() > 1) {
                // <text<0,1!>> : the inner pair names the enclosing phrase's styles
                const size_t open_index = frame.open_index;
                frames_.pop();
                frames_.top().arguments       = std::move(arguments);
                frames_.top().override_always = override_always;
                document_.buffer.resize(open_index);
            } else {
                // <0,1!>text> : a leading specifier names this phrase's styles
                frame.arguments       = std::move(arguments);
                frame.override_always = override_always;
                document_.buffer.resize(begin);
            }
            return;
        }
    }

    Phrase phrase = std::move(frame);
    frames_.pop();
    state_ = frames_.empty() ? State::SCANNING_TOP : State::SCANNING_PHRASE;

    phrase.close_index = tag.index;
    attach(std::move(phrase));
}

inline void PhraseTreeBuilder::handle_orphan_close(const Tag& tag) {
    // Nothing to close, the marker stays in the text as is
    if (diagnostics_) {
        diagnostics_->warn("Un-escaped '>' character", tag.source_index, position(markup_, tag.source_index));
    }
}

inline void PhraseTreeBuilder::attach(Phrase phrase) {
    if (frames_.empty()) {
        document_.phrases.push_back(std::move(phrase));
    } else {
        frames_.top().children.push_back(std::move(phrase));
    }
}

inline void PhraseTreeBuilder::fail_unclosed() const {
    constexpr size_t CONTEXT_LEN = 20;

    const Phrase& innermost = frames_.top();
    const size_t begin      = innermost.source_index + 1;

    // Cut at a UTF-8 code point boundary
    size_t end = std::min(begin + CONTEXT_LEN, markup_.size());
    while (end > begin && end < markup_.size() && (static_cast<unsigned char>(markup_[end]) & 0xC0) == 0x80) {
        --end;
    }
    const std::string_view context = markup_.substr(begin, end - begin);

    throw ParseError("No closing tag found for opening tag at position " +
                     position(markup_, innermost.source_index) + " (before '" + std::string(context) + "')!");
}

inline bool PhraseTreeBuilder::parse_arguments(std::string_view content, std::vector<long long>& arguments,
                                               bool& override_always) {
    bool override_marker = false;
    if (!content.empty() && content.back() == syntax::OVERRIDE) {
        override_marker = true;
        content.remove_suffix(1);
    }
    if (!content.empty() && content.back() == syntax::ARGUMENT_SEP) {
        content.remove_suffix(1);
    }
    if (content.empty()) return false;

    std::vector<long long> parsed;
    while (true) {
        const size_t sep = content.find(syntax::ARGUMENT_SEP);
        const std::string_view item = content.substr(0, sep);

        const size_t digits_start = (!item.empty() && item.front() == syntax::NEGATIVE) ? 1 : 0;
        if (item.size() == digits_start) return false;
        for (size_t i = digits_start; i < item.size(); ++i) {
            if (item[i] < '0' || item[i] > '9') return false;
        }

        long long value = 0;
        const auto result = std::from_chars(item.data(), item.data() + item.size(), value);
        if (result.ec == std::errc::result_out_of_range) {
            // Too large to be a valid slot either way
            value = digits_start ? LLONG_MIN : LLONG_MAX;
        }
        parsed.push_back(value);

        if (sep == std::string_view::npos) break;
        content.remove_prefix(sep + 1);
    }

    arguments       = std::move(parsed);
    override_always = override_marker;
    return true;
}

} // namespace tagstyle
