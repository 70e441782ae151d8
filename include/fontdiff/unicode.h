#pragma once

#include <fontdiff/shaper.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fontdiff::unicode {

// "U+0041", at least four upper-case hex digits
std::string formatCodepoint(uint32_t codepoint);

// Unicode character name ("LATIN CAPITAL LETTER A"); the extended name
// ("<control-0000>") for characters without one
std::string codepointName(uint32_t codepoint);

// Long script property value name ("Latin", "Ol_Chiki"); empty for
// unassigned codepoints
std::string scriptName(uint32_t codepoint);

struct ScriptInfo {
    std::string name;        // "Arabic"
    std::string tag;         // ISO 15924, "Arab"
    Direction direction = Direction::LeftToRight;
};

// Lookup by long script name; nullopt for names Unicode does not define
std::optional<ScriptInfo> scriptInfo(const std::string& name);

std::string encodeUtf8(uint32_t codepoint);

// Malformed sequences are skipped
std::vector<uint32_t> decodeUtf8(const std::string& text);

} // namespace fontdiff::unicode
