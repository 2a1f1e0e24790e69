#include <flags.h>
#include <parser.h>
#include <resolver.h>
#include <style_args.h>
#include "report.h"

using namespace tagstyle;

static std::string codeOf(const Phrase& phrase) {
    return phrase.style_code ? *phrase.style_code : "<unset>";
}

inline bool testResolver() {
    bool passing = true;
    const FlagTable& table = FlagTable::standard();

    const Flag& bold      = table.at("bold");
    const Flag& red       = table.at("red");
    const Flag& underline = table.at("underline");
    const FlagCombination green = table.at("green").bit;

    const StyleSheet sheet = StyleSheet::build({bold, red, underline, StyleArg::always("hi", green)}, table);

    // Arguments combine, always style merges unless overridden
    Document document = PhraseTreeBuilder().build("<x<0,2>> <hi<1>> <hi<1!>> <hi>");
    StyleResolver resolver(sheet, table);
    resolver.resolve(document);
    if (document.phrases.size() == 4) {
        passing &= expectEqual(codeOf(document.phrases[0]), "1;4", __LINE__);
        passing &= expectEqual(codeOf(document.phrases[1]), "31;32", __LINE__);
        passing &= expectEqual(codeOf(document.phrases[2]), "31", __LINE__);
        passing &= expectEqual(codeOf(document.phrases[3]), "32", __LINE__);
    } else {
        std::cout << "Line " << __LINE__ << ", expected four phrases" << std::endl;
        passing = false;
    }
    passing &= expectEqual(resolver.consumed(), 0, __LINE__);

    // Sequential styles follow document order: parent, children, next sibling
    const StyleSheet three = StyleSheet::build({bold, red, green}, table);
    document = PhraseTreeBuilder().build("<a<b><c>><d>");
    StyleResolver sequential(three, table);
    passing &= expectThrow<ArgumentError>([&] { sequential.resolve(document); }, __LINE__,
                                          "Requested a 4th formatting argument for 'd' but only 3 were supplied!");

    const StyleSheet styles = StyleSheet::build({bold, red, green, underline, bold}, table);
    document = PhraseTreeBuilder().build("<a<b><c>><d>");
    StyleResolver ordered(styles, table);
    ordered.resolve(document);
    if (document.phrases.size() == 2 && document.phrases[0].children.size() == 2) {
        passing &= expectEqual(codeOf(document.phrases[0]), "1", __LINE__);
        passing &= expectEqual(codeOf(document.phrases[0].children[0]), "31", __LINE__);
        passing &= expectEqual(codeOf(document.phrases[0].children[1]), "32", __LINE__);
        passing &= expectEqual(codeOf(document.phrases[1]), "4", __LINE__);
    } else {
        std::cout << "Line " << __LINE__ << ", unexpected tree shape" << std::endl;
        passing = false;
    }
    passing &= expectEqual(ordered.consumed(), 4, __LINE__);

    // A phrase is resolved exactly once
    passing &= expectThrow<InternalError>([&] { ordered.resolve(document); }, __LINE__, "already resolved");

    // Named and always phrases do not advance the counter
    document = PhraseTreeBuilder().build("<a<1>> <hi> <b>");
    StyleResolver mixed(sheet, table);
    mixed.resolve(document);
    if (document.phrases.size() == 3) {
        passing &= expectEqual(codeOf(document.phrases[2]), "1", __LINE__);
    }
    passing &= expectEqual(mixed.consumed(), 1, __LINE__);

    report("Resolver", passing);
    return passing;
}

inline bool testResolverErrors() {
    bool passing = true;
    const FlagTable& table = FlagTable::standard();
    const StyleSheet sheet = StyleSheet::build({table.at("bold"), table.at("red")}, table);

    auto resolveText = [&](const std::string& markup) {
        Document document = PhraseTreeBuilder().build(markup);
        StyleResolver(sheet, table).resolve(document);
    };

    passing &= expectThrow<ArgumentError>([&] { resolveText("<a> <b> <c>"); }, __LINE__,
                                          "Requested a 3rd formatting argument for 'c' but only 2 were supplied!");
    passing &= expectThrow<ArgumentError>([&] { resolveText("<x<0,5>>"); }, __LINE__,
                                          "Positional argument '5' (argument 1) of phrase 'x' is out of range");
    passing &= expectThrow<ArgumentError>([&] { resolveText("<x<2>>"); }, __LINE__, "only 2 positional style(s)");
    passing &= expectThrow<ArgumentError>([&] { resolveText("<x<-1>>"); }, __LINE__, "Positional argument '-1'");
    passing &= expectThrow<ArgumentError>([&] { resolveText("<x<99999999999999999999>>"); }, __LINE__,
                                          "out of range");

    const StyleSheet empty = StyleSheet::build({}, table);
    Document document = PhraseTreeBuilder().build("<only>");
    passing &= expectThrow<ArgumentError>([&] { StyleResolver(empty, table).resolve(document); }, __LINE__,
                                          "Requested a 1st formatting argument for 'only' but only 0 were supplied!");

    report("Resolver errors", passing);
    return passing;
}
