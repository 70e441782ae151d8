#include <fontdiff/font-source.h>
#include <fontdiff/diff.h>
#include <fontdiff/unicode.h>

#include <ytrace/ytrace.hpp>

namespace fontdiff {

Value FontSource::decodeTables() const {
    Object tables;
    for (const auto& tag : tableNames()) {
        auto res = decodeTable(tag);
        if (!res) {
            ywarn("{}: could not decode '{}': {}", name(), tag, error_msg(res));
            tables.insert(tag, errorLeaf(error_msg(res)));
            continue;
        }
        tables.insert(tag, std::move(*res));
    }
    return Value(std::move(tables));
}

std::set<std::string> FontSource::supportedScripts() const {
    std::set<std::string> scripts;
    for (uint32_t cp : codepoints()) {
        auto script = unicode::scriptName(cp);
        if (!script.empty()) {
            scripts.insert(std::move(script));
        }
    }
    return scripts;
}

} // namespace fontdiff
