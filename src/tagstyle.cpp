// tagstyle.cpp - Command line front end for the tagstyle library

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "beautifier.h"
#include "diagnostics.h"
#include "flags.h"
#include "style_args.h"
#include "texts.h"

using namespace tagstyle;

static int f_quiet = 0;
static int f_strip = 0;

static struct option long_options[] = {
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'v'},
    {"legend", no_argument, nullptr, 'l'},
    {"style", required_argument, nullptr, 's'},
    {"always", required_argument, nullptr, 'a'},
    {"quiet", no_argument, &f_quiet, 'q'},
    {"strip", no_argument, &f_strip, 'S'},
    {"demo", no_argument, nullptr, 0},
    {nullptr, 0, nullptr, 0},
};

static void print_legend(const FlagTable& table) {
    std::printf("%s", texts::LEGEND + 1);
    for (const auto& category : table.categories()) {
        std::printf("\n  %s:\n", category.name.c_str());
        for (const auto& flag : category.flags) {
            const std::string code = std::to_string(flag.code);
            std::printf("    %s%-16s%s %3s\n", ansi::start(code).c_str(), flag.name.c_str(),
                        ansi::reset_to("").c_str(), code.c_str());
        }
    }
}

static std::string read_all(FILE* istream) {
    std::string input;
    int c;
    while ((c = std::getc(istream)) != EOF) {
        input += static_cast<char>(c);
    }
    return input;
}

int main(int argc, char* argv[]) {
    auto logger = spdlog::stderr_color_mt("tagstyle");
    logger->set_pattern("%n: %^%l%$: %v");

    const FlagTable& table = FlagTable::standard();
    std::vector<StyleArg> args;
    bool demo = false;

    int opt;
    int opt_idx;

    try {
        while ((opt = getopt_long(argc, argv, "?hvls:a:qS", long_options, &opt_idx)) != -1) {
            switch (opt) {
            case 0:
                if (std::strcmp(long_options[opt_idx].name, "demo") == 0) {
                    demo = true;
                }
                break;

            case '?':
                std::fprintf(stderr, texts::USAGE + 1, argv[0]);
                std::fprintf(stderr, "(try using -h or --help for more info)\n");
                return EXIT_FAILURE;

            case 'h':
                std::printf(texts::USAGE + 1, argv[0]);
                std::printf("\n%s", texts::HELP + 1);
                return EXIT_SUCCESS;

            case 'v':
                std::puts(texts::VERSION);
                return EXIT_SUCCESS;

            case 'l':
                print_legend(table);
                return EXIT_SUCCESS;

            case 's':
                args.emplace_back(parse_style(optarg, table));
                break;
            case 'a':
                args.push_back(parse_always(optarg, table));
                break;
            case 'q':
                f_quiet = 1;
                break;
            case 'S':
                f_strip = 1;
                break;
            }
        }

        if (f_quiet) {
            logger->set_level(spdlog::level::err);
        }

        if (demo) {
            args.clear();
            for (const char* spec : texts::DEMO_STYLES) {
                args.emplace_back(parse_style(spec, table));
            }
            for (const char* entry : texts::DEMO_ALWAYS) {
                args.push_back(parse_always(entry, table));
            }
        }

        const Beautifier beautifier(args, table);
        Diagnostics diagnostics(logger);

        auto process = [&](const std::string& markup) {
            return f_strip ? beautifier.strip(markup, diagnostics) : beautifier.render(markup, diagnostics);
        };

        if (demo) {
            std::printf("%s", process(texts::DEMO + 1).c_str());
        } else if (optind < argc) {
            // Process positional arguments
            const char* separator = "";
            while (optind < argc) {
                const std::string output = process(argv[optind]);
                std::printf("%s%s", separator, output.c_str());
                separator = " ";
                optind++;
            }
            std::printf("\n");
        } else {
            // Read from stdin
            std::printf("%s", process(read_all(stdin)).c_str());
        }
    } catch (const tagstyle::Error& e) {
        std::fflush(stdout);
        logger->error(e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
