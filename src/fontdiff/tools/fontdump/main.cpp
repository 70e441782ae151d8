#include <fontdiff/font/ft-font.h>
#include <fontdiff/location.h>
#include <fontdiff/value.h>

#include <args.hxx>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

using namespace fontdiff;

int main(int argc, char** argv) {
    args::ArgumentParser parser("fontdump", "Print the decoded tables of a font as JSON.");
    parser.Prog("fontdump");
    args::HelpFlag helpFlag(parser, "help", "Show this help", {'h', "help"});
    args::ValueFlag<std::string> tableFlag(parser, "tag", "Only this table", {'t', "table"});
    args::ValueFlag<std::string> locationFlag(parser, "axis=value,...",
                                              "Location in design space", {"location"});
    args::Flag compactFlag(parser, "compact", "Single-line JSON", {"compact"});
    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});
    args::Positional<std::string> fontArg(parser, "font", "Font file", args::Options::Required);

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

    auto font = font::FtFont::open(args::get(fontArg));
    if (!font) {
        std::cerr << "fontdump: " << error_msg(font) << "\n";
        return 1;
    }

    if (locationFlag) {
        auto location = parseLocation(args::get(locationFlag));
        if (!location) {
            std::cerr << "fontdump: " << error_msg(location) << "\n";
            return 1;
        }
        if (auto res = (*font)->setLocation(*location); !res) {
            std::cerr << "fontdump: " << error_msg(res) << "\n";
            return 1;
        }
    }

    Value out;
    if (tableFlag) {
        auto table = (*font)->decodeTable(args::get(tableFlag));
        if (!table) {
            std::cerr << "fontdump: " << error_msg(table) << "\n";
            return 1;
        }
        out = std::move(*table);
    } else {
        out = (*font)->decodeTables();
    }

    std::cout << out.toJson(compactFlag ? -1 : 2) << "\n";
    return 0;
}
