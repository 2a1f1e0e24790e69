// beautifier.h - Renders tagged markup with a fixed style configuration
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "diagnostics.h"
#include "flags.h"
#include "parser.h"
#include "renderer.h"
#include "resolver.h"
#include "style_args.h"

namespace tagstyle {

// Owns one validated configuration. render() keeps all per-call state local,
// so calls are independent of each other.
//
//   Beautifier b({bold, red, StyleArg::always("ok", green)});
//   b.render("<Hello>, <World>! <ok>");
class Beautifier {
public:
    // Throws FlagError if any combination lies outside the table's range
    explicit Beautifier(const std::vector<StyleArg>& args = {}, FlagTable table = FlagTable::standard())
        : table_(std::move(table)), sheet_(StyleSheet::build(args, table_)) {}

    // Warnings go to spdlog's default logger
    std::string render(std::string_view markup) const {
        Diagnostics diagnostics(spdlog::default_logger());
        return render(markup, diagnostics);
    }

    // Warnings go to `diagnostics`; ParseError and ArgumentError propagate
    std::string render(std::string_view markup, Diagnostics& diagnostics) const {
        Document document = PhraseTreeBuilder(&diagnostics).build(markup);

        StyleResolver resolver(sheet_, table_);
        resolver.resolve(document);

        return Renderer(document).render();
    }

    // Plain text: tags, argument specifiers and escapes removed, no codes
    std::string strip(std::string_view markup) const {
        Diagnostics diagnostics(spdlog::default_logger());
        return strip(markup, diagnostics);
    }

    std::string strip(std::string_view markup, Diagnostics& diagnostics) const {
        Document document = PhraseTreeBuilder(&diagnostics).build(markup);
        return Renderer(document, true).render();
    }

    const StyleSheet& sheet() const { return sheet_; }
    const FlagTable& table() const { return table_; }

private:
    FlagTable table_;
    StyleSheet sheet_;
};

// One-shot convenience around Beautifier
inline std::string beautify(std::string_view markup, const std::vector<StyleArg>& args,
                            const FlagTable& table = FlagTable::standard()) {
    return Beautifier(args, table).render(markup);
}

} // namespace tagstyle
