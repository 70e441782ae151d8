#include <fontdiff/unicode.h>

#include <unicode/uchar.h>
#include <unicode/uscript.h>
#include <unicode/utf8.h>

#include <cstdio>

namespace fontdiff::unicode {

std::string formatCodepoint(uint32_t codepoint) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "U+%04X", codepoint);
    return buf;
}

std::string codepointName(uint32_t codepoint) {
    char buf[256];
    UErrorCode status = U_ZERO_ERROR;
    int32_t len = u_charName(static_cast<UChar32>(codepoint), U_UNICODE_CHAR_NAME,
                             buf, sizeof(buf), &status);
    if (U_SUCCESS(status) && len > 0) {
        return std::string(buf, static_cast<size_t>(len));
    }

    status = U_ZERO_ERROR;
    len = u_charName(static_cast<UChar32>(codepoint), U_EXTENDED_CHAR_NAME,
                     buf, sizeof(buf), &status);
    if (U_SUCCESS(status) && len > 0) {
        return std::string(buf, static_cast<size_t>(len));
    }
    return "";
}

std::string scriptName(uint32_t codepoint) {
    UErrorCode status = U_ZERO_ERROR;
    UScriptCode code = uscript_getScript(static_cast<UChar32>(codepoint), &status);
    if (U_FAILURE(status) || code == USCRIPT_INVALID_CODE || code == USCRIPT_UNKNOWN) {
        return "";
    }
    const char* name = uscript_getName(code);
    return name ? name : "";
}

std::optional<ScriptInfo> scriptInfo(const std::string& name) {
    int32_t value = u_getPropertyValueEnum(UCHAR_SCRIPT, name.c_str());
    if (value == UCHAR_INVALID_CODE) {
        return std::nullopt;
    }
    auto code = static_cast<UScriptCode>(value);

    ScriptInfo info;
    const char* longName = uscript_getName(code);
    const char* shortName = uscript_getShortName(code);
    info.name = longName ? longName : name;
    info.tag = shortName ? shortName : "";
    info.direction = uscript_isRightToLeft(code) ? Direction::RightToLeft
                                                 : Direction::LeftToRight;
    return info;
}

std::string encodeUtf8(uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x110000) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    return out;
}

std::vector<uint32_t> decodeUtf8(const std::string& text) {
    std::vector<uint32_t> out;
    out.reserve(text.size());

    const uint8_t* s = reinterpret_cast<const uint8_t*>(text.data());
    int32_t length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        // negative for an ill-formed or truncated sequence
        if (c >= 0) out.push_back(static_cast<uint32_t>(c));
    }
    return out;
}

} // namespace fontdiff::unicode
