#pragma once

#include <fontdiff/result.hpp>
#include <fontdiff/value.h>

#include <cstddef>
#include <cstdint>
#include <string>

typedef struct FT_FaceRec_* FT_Face;

namespace fontdiff::font {

// 'h','e','a','d' <-> "head"
std::string tagToString(unsigned long tag);
unsigned long stringToTag(const std::string& tag);

// Windows and Unicode platform name strings to UTF-8. A trailing odd byte
// is dropped and an unpaired surrogate becomes U+FFFD.
std::string decodeUtf16Be(const uint8_t* data, size_t length);

// English (or first) entry of the name table for nameId, empty if absent
std::string nameString(FT_Face face, unsigned nameId);

// Structured decoders, Err when FreeType has no such table
Result<Value> decodeHead(FT_Face face);
Result<Value> decodeHhea(FT_Face face);
Result<Value> decodeVhea(FT_Face face);
Result<Value> decodeMaxp(FT_Face face);
Result<Value> decodeOs2(FT_Face face);
Result<Value> decodePost(FT_Face face);
Result<Value> decodeName(FT_Face face);
Result<Value> decodeFvar(FT_Face face);
Result<Value> decodeCmap(FT_Face face);

// Raw table bytes as an array of numbers
Result<Value> decodeRaw(FT_Face face, const std::string& tag);

} // namespace fontdiff::font
