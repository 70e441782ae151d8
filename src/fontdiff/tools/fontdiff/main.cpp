#include "report.h"

#include <fontdiff/config.h>
#include <fontdiff/font-differ.h>
#include <fontdiff/font/ft-font.h>
#include <fontdiff/location.h>
#include <fontdiff/wordlists.h>

#include <args.hxx>
#include <spdlog/spdlog.h>
#include <ytrace/ytrace.hpp>

#include <iostream>
#include <string>

#ifdef __unix__
#include <unistd.h>
#endif

using namespace fontdiff;

template<typename T>
static int die(const std::string& doing, const Result<T>& res) {
    std::cerr << "Error " << doing << ": " << res.error().message() << "\n";
    if (res.error().cause()) {
        std::cerr << "\nCaused by:\n";
        int i = 0;
        for (const Error* e = res.error().cause(); e; e = e->cause()) {
            std::cerr << "   " << i++ << ": " << e->message() << "\n";
        }
    }
    return 1;
}

static bool stdoutIsTerminal() {
#ifdef __unix__
    return isatty(STDOUT_FILENO) != 0;
#else
    return false;
#endif
}

static void describe(const char* role, const font::FtFont& font) {
    yinfo("{} font: {} ({}{}), {} codepoints", role, font.label(), font.familyName(),
          font.isVariable() ? ", variable" : "", font.codepoints().size());
    if (font.isColor()) {
        ywarn("{} has colour glyph tables; only outlines are compared", font.label());
    }
}

int main(int argc, char** argv) {
    args::ArgumentParser parser("fontdiff", "Compare two versions of a font: tables, glyph "
                                            "renderings and word renderings.");
    parser.Prog("fontdiff");
    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::Flag jsonFlag(parser, "json", "Print the diff as JSON", {"json"});
    args::Flag noTablesFlag(parser, "no-tables", "Don't diff font tables", {"no-tables"});
    args::Flag noGlyphsFlag(parser, "no-glyphs", "Don't diff glyph renderings", {"no-glyphs"});
    args::Flag noWordsFlag(parser, "no-words", "Don't diff word renderings", {"no-words"});
    args::Flag noSuccinctFlag(parser, "no-succinct",
                              "Show both values even when one side is absent", {"no-succinct"});
    args::Flag noColorFlag(parser, "no-color", "Plain text report", {"no-color"});
    args::ValueFlag<std::string> locationFlag(parser, "axis=value,...",
                                              "Location in design space, e.g. wght=700,wdth=75",
                                              {"location"});
    args::ValueFlag<std::string> instanceFlag(parser, "name", "Named instance to compare",
                                              {"instance"});
    args::ValueFlag<std::string> configFlag(parser, "file", "YAML config file", {'c', "config"});
    args::ValueFlag<std::string> wordlistsFlag(parser, "dir", "Word list directory",
                                               {"wordlists"});
    args::ValueFlag<float> fontSizeFlag(parser, "size", "Rendering size (default: 40)",
                                        {"font-size"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Positional<std::string> fontAArg(parser, "old-font", "The old font file",
                                           args::Options::Required);
    args::Positional<std::string> fontBArg(parser, "new-font", "The new font file",
                                           args::Options::Required);

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::Error& e) {
        std::cerr << e.what() << "\n\n" << parser;
        return 1;
    }

    spdlog::set_level(verboseFlag ? spdlog::level::debug : spdlog::level::warn);

    // Command-line flags are the last config layer
    YAML::Node overrides(YAML::NodeType::Map);
    if (noTablesFlag) overrides["diff"]["tables"] = false;
    if (noGlyphsFlag) overrides["diff"]["glyphs"] = false;
    if (noWordsFlag) overrides["diff"]["words"] = false;
    if (noSuccinctFlag) overrides["diff"]["succinct"] = false;
    if (fontSizeFlag) overrides["render"]["font-size"] = args::get(fontSizeFlag);
    if (wordlistsFlag) overrides["wordlists"]["path"] = args::get(wordlistsFlag);

    auto config = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!config) return die("loading configuration", config);

    auto fontA = font::FtFont::open(args::get(fontAArg));
    if (!fontA) return die("opening " + args::get(fontAArg), fontA);
    auto fontB = font::FtFont::open(args::get(fontBArg));
    if (!fontB) return die("opening " + args::get(fontBArg), fontB);
    describe("Old", **fontA);
    describe("New", **fontB);

    auto located = applyLocation(**fontA, **fontB,
                                 locationFlag ? args::get(locationFlag) : "",
                                 instanceFlag ? args::get(instanceFlag) : "");
    if (!located) return die("setting location", located);

    DiffOptions options = DiffOptions::fromConfig(**config);
    if (options.fontSize <= 0.0f) {
        std::cerr << "Error: font size must be positive\n";
        return 1;
    }

    WordListSource::Ptr wordLists;
    if (options.words) {
        std::string path = (*config)->get<std::string>(Config::KEY_WORDLISTS_PATH, "");
        auto lists = DirectoryWordLists::create(path);
        if (lists) {
            wordLists = *lists;
        } else {
            ywarn("No word lists, word diff skipped: {}", error_msg(lists));
        }
    }

    FontDiffer differ(**fontA, **fontB, options, wordLists.get());
    auto diff = differ.run();
    if (!diff) return die("comparing fonts", diff);

    if (jsonFlag) {
        std::cout << diff->toJson(2) << "\n";
        return 0;
    }

    tools::ReportStyle style;
    style.succinct = (*config)->get<bool>(Config::KEY_SUCCINCT, true);
    style.color = !noColorFlag && stdoutIsTerminal();
    tools::printReport(std::cout, *diff, style);
    return 0;
}
