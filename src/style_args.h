// style_args.h - Style configuration values and their validated tables
#pragma once

#include <cctype>
#include <charconv>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "errors.h"
#include "flags.h"
#include "syntax.h"

namespace tagstyle {

// One configuration value: a flag, a flag combination, an "always" entry
// mapping phrase texts to a combination, or a sequence of these.
class StyleArg {
public:
    enum class Kind {
        FLAG,
        COMBINATION,
        ALWAYS,
        SEQUENCE,
    };

    StyleArg(const Flag& flag) : kind_(Kind::FLAG), combination_(flag.bit) {}
    StyleArg(FlagCombination combination) : kind_(Kind::COMBINATION), combination_(combination) {}
    StyleArg(std::vector<StyleArg> items) : kind_(Kind::SEQUENCE), items_(std::move(items)) {}

    // Every text in `texts` always renders with `combination`
    static StyleArg always(std::vector<std::string> texts, FlagCombination combination) {
        StyleArg arg(combination);
        arg.kind_  = Kind::ALWAYS;
        arg.texts_ = std::move(texts);
        return arg;
    }

    static StyleArg always(std::string text, FlagCombination combination) {
        return always(std::vector<std::string>{std::move(text)}, combination);
    }

    Kind kind() const { return kind_; }
    FlagCombination combination() const { return combination_; }
    const std::vector<std::string>& texts() const { return texts_; }
    const std::vector<StyleArg>& items() const { return items_; }

private:
    Kind kind_;
    FlagCombination combination_ = 0;
    std::vector<std::string> texts_;
    std::vector<StyleArg> items_;
};

// Validated, flattened configuration
struct StyleSheet {
    std::vector<FlagCombination> positional;
    std::map<std::string, FlagCombination, std::less<>> always;

    // Throws FlagError on the first combination outside the table's range
    static StyleSheet build(const std::vector<StyleArg>& args, const FlagTable& table);

    const FlagCombination* find_always(std::string_view text) const {
        auto it = always.find(text);
        return it == always.end() ? nullptr : &it->second;
    }

private:
    void add(const StyleArg& arg, const FlagTable& table);
};

// Implementation

inline StyleSheet StyleSheet::build(const std::vector<StyleArg>& args, const FlagTable& table) {
    StyleSheet sheet;
    for (const auto& arg : args) {
        sheet.add(arg, table);
    }
    return sheet;
}

inline void StyleSheet::add(const StyleArg& arg, const FlagTable& table) {
    switch (arg.kind()) {
    case StyleArg::Kind::FLAG:
    case StyleArg::Kind::COMBINATION:
        table.validate(arg.combination());
        positional.push_back(arg.combination());
        break;

    case StyleArg::Kind::ALWAYS:
        table.validate(arg.combination());
        for (const auto& text : arg.texts()) {
            always[text] = arg.combination();
        }
        break;

    case StyleArg::Kind::SEQUENCE:
        for (const auto& item : arg.items()) {
            add(item, table);
        }
        break;
    }
}

// "bold+red", "underline|fill_blue" or a decimal combination such as "257"
inline FlagCombination parse_style(std::string_view spec, const FlagTable& table) {
    auto trim = [](std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    };

    spec = trim(spec);
    if (spec.empty()) {
        throw FlagError("Empty style specification!");
    }

    if (std::isdigit(static_cast<unsigned char>(spec.front()))) {
        FlagCombination combination = 0;
        const auto result = std::from_chars(spec.data(), spec.data() + spec.size(), combination);
        if (result.ec == std::errc::result_out_of_range) {
            throw FlagError("Flag value '" + std::string(spec) + "' is out of range!");
        }
        if (result.ec != std::errc() || result.ptr != spec.data() + spec.size()) {
            throw FlagError("Malformed flag value '" + std::string(spec) + "'!");
        }
        table.validate(combination);
        return combination;
    }

    FlagCombination combination = 0;
    while (true) {
        const size_t joiner = spec.find_first_of(syntax::FLAG_JOINERS);
        combination |= table.at(trim(spec.substr(0, joiner))).bit;
        if (joiner == std::string_view::npos) break;
        spec.remove_prefix(joiner + 1);
    }
    return combination;
}

// "ok=green" or "ok,done=green+bold": comma separated texts share one style
inline StyleArg parse_always(std::string_view entry, const FlagTable& table) {
    const size_t equals = entry.rfind('=');
    if (equals == std::string_view::npos || equals == 0) {
        throw FlagError("Always style '" + std::string(entry) + "' is not of the form TEXT=STYLE!");
    }

    std::vector<std::string> texts;
    std::string_view keys = entry.substr(0, equals);
    while (true) {
        const size_t sep = keys.find(syntax::ARGUMENT_SEP);
        texts.emplace_back(keys.substr(0, sep));
        if (sep == std::string_view::npos) break;
        keys.remove_prefix(sep + 1);
    }

    return StyleArg::always(std::move(texts), parse_style(entry.substr(equals + 1), table));
}

} // namespace tagstyle
