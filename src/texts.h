// texts.h - Documentation strings for the tagstyle command
// VERSION is substituted from the CMake project version.

#pragma once

#ifndef TAGSTYLE_VERSION
#define TAGSTYLE_VERSION "unknown"
#endif

namespace texts {

inline const char* USAGE = R"-(
Usage: %s [options] [strings...]
)-";

inline const char* HELP = R"-(
Phrase styler, tagstyle )-" TAGSTYLE_VERSION R"-(

Description:
    Translates '<phrase>' tags into ANSI formatting. Styles are supplied with
    -s (matched to phrases from left to right) and -a (bound to a phrase
    text). When no strings are passed, input is read from STDIN. Otherwise,
    the strings are rendered separately and printed separated by spaces.

Options:
    -s --style SPEC         append a positional style
    -a --always TEXTS=SPEC  always render phrase TEXTS (comma separated)
                            with SPEC
    -l --legend             list the available flags and their codes
    -q --quiet              do not report warnings
    -S --strip              print the text without styles or tags
       --demo               show demo
    -v --version            print version string
    -h --help               display this help and exit

Style specifications:
    SPEC is a list of flag names joined by '+' or '|', or a decimal flag
    combination:
     $ tagstyle -s bold+red -s underline '<Hello>, <World>!'

Markup:
    <text>          styled with the next positional style, or with the
                    always style bound to 'text'
    <text<1,2>>     styled with positional styles 1 and 2 combined, plus
                    the always style bound to 'text'
    <text<1!>>      as above, ignoring the always style
    <1,2>text>      same as <text<1,2>> for a phrase outside any other
    \< \>           literal markers
    \\<             literal backslash followed by a real marker

    Phrases nest. Closing an inner phrase restores the outer phrase's style:
     $ tagstyle -s red -s bold '<red <red and bold> red again>'

Errors:
    A phrase that is never closed, or a phrase asking for a style that was
    not supplied, is an error and nothing is printed for that input.
    A stray '>' outside of any phrase only produces a warning.
)-";

inline const char* LEGEND = R"-(
Flags by category, in the order their codes are emitted:
)-";

inline const char* DEMO = R"-(
<Hello<0>>, <World<1>>!
Always styles: <ok>, <warning> and <error>.
Nested: <outer text <inner text<3>> outer again<2>>
Override: <ok<1!>> ignores the always style, <ok<1>> merges with it.
Escapes: \<not a tag\> but \\<a tag>
)-";

// Style arguments the demo is rendered with
inline const char* DEMO_STYLES[] = {
    "bold", "red", "underline+cyan", "fill_blue+white",
};

inline const char* DEMO_ALWAYS[] = {
    "ok=green", "warning=yellow+bold", "error=light_red+bold",
};

inline const char* VERSION = TAGSTYLE_VERSION;

} // namespace texts
