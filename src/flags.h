// flags.h - Style flags, their categories and render codes
#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ansi.h"
#include "errors.h"

namespace tagstyle {

// Bitwise OR of individual flag bits
using FlagCombination = uint64_t;

struct Flag {
    std::string name;
    FlagCombination bit = 0;
    int code            = 0; // SGR code emitted when the bit is set
};

struct FlagCategory {
    std::string name;
    std::vector<Flag> flags;
};

// Ordered set of categories. The declaration order of categories and of the
// flags inside them is the order codes appear in rendered output.
class FlagTable {
public:
    explicit FlagTable(std::vector<FlagCategory> categories);

    // Built-in table: format, color, fill
    static const FlagTable& standard();

    const std::vector<FlagCategory>& categories() const { return categories_; }

    // Every bit used by a flag of the table
    FlagCombination mask() const { return mask_; }

    // Throws FlagError if `combination` sets a bit no flag uses
    void validate(FlagCombination combination) const;

    // Case-insensitive lookup, nullptr if unknown
    const Flag* find(std::string_view name) const;

    // As find(), but throws FlagError for unknown names
    const Flag& at(std::string_view name) const;

    // Set flags' codes in table order, joined by ';'
    std::string codify(FlagCombination combination) const;

private:
    std::vector<FlagCategory> categories_;
    FlagCombination mask_ = 0;
};

// Implementation

inline FlagTable::FlagTable(std::vector<FlagCategory> categories) : categories_(std::move(categories)) {
    std::vector<int> seen_codes;

    for (const auto& category : categories_) {
        for (const auto& flag : category.flags) {
            if (flag.bit == 0 || (flag.bit & (flag.bit - 1)) != 0) {
                throw FlagError("Flag '" + flag.name + "' must have exactly one bit set!");
            }
            if (mask_ & flag.bit) {
                throw FlagError("Flag '" + flag.name + "' reuses a bit of another flag!");
            }
            for (int code : seen_codes) {
                if (code == flag.code) {
                    throw FlagError("Flag '" + flag.name + "' reuses code " + std::to_string(code) + "!");
                }
            }
            mask_ |= flag.bit;
            seen_codes.push_back(flag.code);
        }
    }
}

inline void FlagTable::validate(FlagCombination combination) const {
    if (combination & ~mask_) {
        throw FlagError("Flag value '" + std::to_string(combination) + "' is out of range!");
    }
}

inline const Flag* FlagTable::find(std::string_view name) const {
    auto same = [](std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    };

    for (const auto& category : categories_) {
        for (const auto& flag : category.flags) {
            if (same(flag.name, name)) return &flag;
        }
    }
    return nullptr;
}

inline const Flag& FlagTable::at(std::string_view name) const {
    const Flag* flag = find(name);
    if (!flag) {
        throw FlagError("Unknown flag '" + std::string(name) + "'!");
    }
    return *flag;
}

inline std::string FlagTable::codify(FlagCombination combination) const {
    std::string codes;
    for (const auto& category : categories_) {
        for (const auto& flag : category.flags) {
            if (combination & flag.bit) {
                if (!codes.empty()) codes += ansi::SEP;
                codes += std::to_string(flag.code);
            }
        }
    }
    return codes;
}

inline const FlagTable& FlagTable::standard() {
    static const FlagTable table = [] {
        // Fill reuses the color list as "fill_<color>", codes +10
        const std::vector<std::pair<std::string, int>> colors = {
            {"default", 39},       {"black", 30},        {"red", 31},
            {"green", 32},         {"yellow", 33},       {"blue", 34},
            {"magenta", 35},       {"cyan", 36},         {"light_gray", 37},
            {"dark_gray", 90},     {"light_red", 91},    {"light_green", 92},
            {"light_yellow", 93},  {"light_blue", 94},   {"light_magenta", 95},
            {"light_cyan", 96},    {"white", 97},
        };

        int shift = 0;
        auto next_bit = [&shift] { return FlagCombination{1} << shift++; };

        FlagCategory format{"format", {}};
        for (const auto& [name, code] : std::vector<std::pair<std::string, int>>{
                 {"bold", 1}, {"dim", 2}, {"underline", 4}, {"blink", 5}, {"invert", 7}, {"hidden", 8}}) {
            format.flags.push_back({name, next_bit(), code});
        }

        FlagCategory color{"color", {}};
        for (const auto& [name, code] : colors) {
            color.flags.push_back({name, next_bit(), code});
        }

        FlagCategory fill{"fill", {}};
        for (const auto& [name, code] : colors) {
            fill.flags.push_back({"fill_" + name, next_bit(), code + 10});
        }

        return FlagTable({format, color, fill});
    }();
    return table;
}

} // namespace tagstyle
