// resolver.h - Computes each phrase's style code
#pragma once

#include <cstddef>
#include <stack>
#include <string>
#include <string_view>
#include <vector>

#include "errors.h"
#include "flags.h"
#include "phrase.h"
#include "position.h"
#include "style_args.h"

namespace tagstyle {

// Resolves phrases in document order: a phrase, then its children, then its
// next sibling. Phrases without arguments or an always style take the next
// positional style, so one resolver serves exactly one render call.
class StyleResolver {
public:
    StyleResolver(const StyleSheet& sheet, const FlagTable& table) : sheet_(sheet), table_(table) {}

    void resolve(Document& document);

    // Throws ArgumentError when the phrase asks for a style that was not supplied
    FlagCombination combination(const Phrase& phrase, std::string_view text);

    // Positional styles taken by phrases that did not name one
    size_t consumed() const { return counter_; }

private:
    const StyleSheet& sheet_;
    const FlagTable& table_;
    size_t counter_ = 0;

    FlagCombination from_arguments(const Phrase& phrase, std::string_view text) const;
    FlagCombination next_positional(std::string_view text);
};

// Implementation

inline void StyleResolver::resolve(Document& document) {
    std::stack<Phrase*> pending;
    for (auto it = document.phrases.rbegin(); it != document.phrases.rend(); ++it) {
        pending.push(&*it);
    }

    while (!pending.empty()) {
        Phrase* phrase = pending.top();
        pending.pop();

        const std::string_view text = document.text_of(*phrase);
        if (phrase->style_code) {
            throw InternalError("Phrase '" + std::string(text) + "' was already resolved!");
        }
        phrase->style_code = table_.codify(combination(*phrase, text));

        for (auto it = phrase->children.rbegin(); it != phrase->children.rend(); ++it) {
            pending.push(&*it);
        }
    }
}

inline FlagCombination StyleResolver::combination(const Phrase& phrase, std::string_view text) {
    const FlagCombination* always = sheet_.find_always(text);

    if (!phrase.arguments.empty()) {
        FlagCombination result = from_arguments(phrase, text);
        if (always && !phrase.override_always) {
            result |= *always;
        }
        return result;
    }

    if (always) {
        return *always;
    }

    return next_positional(text);
}

inline FlagCombination StyleResolver::from_arguments(const Phrase& phrase, std::string_view text) const {
    const size_t available = sheet_.positional.size();

    FlagCombination result = 0;
    for (size_t n = 0; n < phrase.arguments.size(); ++n) {
        const long long index = phrase.arguments[n];
        if (index < 0 || static_cast<unsigned long long>(index) >= available) {
            throw ArgumentError("Positional argument '" + std::to_string(index) + "' (argument " +
                                std::to_string(n) + ") of phrase '" + std::string(text) +
                                "' is out of range: only " + std::to_string(available) +
                                " positional style(s) were supplied!");
        }
        result |= sheet_.positional[static_cast<size_t>(index)];
    }
    return result;
}

inline FlagCombination StyleResolver::next_positional(std::string_view text) {
    if (counter_ >= sheet_.positional.size()) {
        throw ArgumentError("Requested " + ordinal(counter_ + 1) + " formatting argument for '" + std::string(text) +
                            "' but only " + std::to_string(sheet_.positional.size()) + " were supplied!");
    }
    return sheet_.positional[counter_++];
}

} // namespace tagstyle
