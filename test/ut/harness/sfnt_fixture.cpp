#include "sfnt_fixture.h"

#include <algorithm>
#include <cmath>

namespace fontdiff::test {

//=============================================================================
// SfntWriter
//=============================================================================

SfntWriter& SfntWriter::u8(uint8_t v) {
    _data.push_back(v);
    return *this;
}

SfntWriter& SfntWriter::u16(uint16_t v) {
    _data.push_back(static_cast<uint8_t>(v >> 8));
    _data.push_back(static_cast<uint8_t>(v & 0xFF));
    return *this;
}

SfntWriter& SfntWriter::i16(int16_t v) {
    return u16(static_cast<uint16_t>(v));
}

SfntWriter& SfntWriter::u32(uint32_t v) {
    u16(static_cast<uint16_t>(v >> 16));
    return u16(static_cast<uint16_t>(v & 0xFFFF));
}

SfntWriter& SfntWriter::i64(int64_t v) {
    u32(static_cast<uint32_t>(static_cast<uint64_t>(v) >> 32));
    return u32(static_cast<uint32_t>(static_cast<uint64_t>(v) & 0xFFFFFFFF));
}

// 16.16
SfntWriter& SfntWriter::fixed(double v) {
    return u32(static_cast<uint32_t>(static_cast<int32_t>(std::lround(v * 65536.0))));
}

SfntWriter& SfntWriter::tag(const char* t) {
    for (int i = 0; i < 4; ++i) _data.push_back(static_cast<uint8_t>(t[i]));
    return *this;
}

SfntWriter& SfntWriter::bytes(const std::vector<uint8_t>& b) {
    _data.insert(_data.end(), b.begin(), b.end());
    return *this;
}

//=============================================================================
// SfntBuilder
//=============================================================================

void SfntBuilder::addTable(const std::string& tag, std::vector<uint8_t> data) {
    _tables.emplace_back(tag, std::move(data));
}

static uint32_t tableChecksum(const std::vector<uint8_t>& data) {
    uint32_t sum = 0;
    for (size_t i = 0; i < data.size(); i += 4) {
        uint32_t word = 0;
        for (size_t j = 0; j < 4; ++j) {
            word = (word << 8) | (i + j < data.size() ? data[i + j] : 0);
        }
        sum += word;
    }
    return sum;
}

std::vector<uint8_t> SfntBuilder::build() const {
    auto tables = _tables;
    std::sort(tables.begin(), tables.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    uint16_t numTables = static_cast<uint16_t>(tables.size());
    uint16_t entrySelector = 0;
    while ((2u << entrySelector) <= numTables) ++entrySelector;
    uint16_t searchRange = static_cast<uint16_t>((1u << entrySelector) * 16);

    SfntWriter out;
    out.u32(0x00010000)
       .u16(numTables)
       .u16(searchRange)
       .u16(entrySelector)
       .u16(static_cast<uint16_t>(numTables * 16 - searchRange));

    uint32_t offset = 12 + 16 * static_cast<uint32_t>(numTables);
    for (const auto& [tag, data] : tables) {
        out.tag(tag.c_str())
           .u32(tableChecksum(data))
           .u32(offset)
           .u32(static_cast<uint32_t>(data.size()));
        offset += static_cast<uint32_t>((data.size() + 3) & ~size_t(3));
    }
    for (const auto& [tag, data] : tables) {
        out.bytes(data);
        while (out.size() % 4) out.u8(0);
    }
    return out.data();
}

//=============================================================================
// Tables
//=============================================================================

namespace {

constexpr uint16_t UPEM = 1000;
constexpr uint16_t NUM_GLYPHS = 3;

std::vector<uint8_t> head() {
    SfntWriter w;
    w.u32(0x00010000)       // version
     .fixed(1.5)            // fontRevision
     .u32(0)                // checksumAdjustment
     .u32(0x5F0F3CF5)       // magicNumber
     .u16(0x0003)           // flags
     .u16(UPEM)
     .i64(0)                // created
     .i64(0)                // modified
     .i16(100).i16(0).i16(500).i16(700)
     .u16(0)                // macStyle
     .u16(8)                // lowestRecPPEM
     .i16(2)                // fontDirectionHint
     .i16(1)                // indexToLocFormat: long
     .i16(0);               // glyphDataFormat
    return w.data();
}

std::vector<uint8_t> hhea() {
    SfntWriter w;
    w.u32(0x00010000)
     .i16(800).i16(-200).i16(0)     // ascender, descender, lineGap
     .u16(600)                      // advanceWidthMax
     .i16(0).i16(0).i16(500)        // minLSB, minRSB, xMaxExtent
     .i16(1).i16(0).i16(0)          // caret rise, run, offset
     .i16(0).i16(0).i16(0).i16(0)   // reserved
     .i16(0)                        // metricDataFormat
     .u16(NUM_GLYPHS);              // numberOfHMetrics
    return w.data();
}

std::vector<uint8_t> maxp() {
    SfntWriter w;
    w.u32(0x00010000)
     .u16(NUM_GLYPHS)
     .u16(4).u16(1)     // maxPoints, maxContours
     .u16(0).u16(0)     // composite points, contours
     .u16(2)            // maxZones
     .u16(0).u16(0).u16(0).u16(0).u16(0).u16(0).u16(0).u16(0);
    return w.data();
}

std::vector<uint8_t> os2() {
    SfntWriter w;
    w.u16(4)                                // version
     .i16(450)                              // xAvgCharWidth
     .u16(400).u16(5)                       // weight, width class
     .u16(0);                               // fsType
    for (int i = 0; i < 10; ++i) w.i16(0);  // sub/superscript, strikeout
    w.i16(0);                               // sFamilyClass
    for (int i = 0; i < 10; ++i) w.u8(static_cast<uint8_t>(i));
    w.u32(1).u32(0).u32(0).u32(0)           // ulUnicodeRange1..4
     .tag("NONE")
     .u16(0x0040)                           // fsSelection: REGULAR
     .u16(0x20).u16(0x41)                   // first, last char index
     .i16(800).i16(-200).i16(0)             // typo ascender, descender, gap
     .u16(800).u16(200)                     // win ascent, descent
     .u32(1).u32(0)                         // code page ranges
     .i16(500).i16(700)                     // xHeight, capHeight
     .u16(0).u16(0x20).u16(1);              // default, break char, max context
    return w.data();
}

std::vector<uint8_t> hmtx() {
    SfntWriter w;
    w.u16(500).i16(0)
     .u16(600).i16(100)
     .u16(250).i16(0);
    return w.data();
}

// gid 1 is the only glyph with data
std::vector<uint8_t> glyf() {
    SfntWriter w;
    w.i16(1)                                    // numberOfContours
     .i16(100).i16(0).i16(500).i16(700)
     .u16(3)                                    // endPtsOfContours
     .u16(0)                                    // instructionLength
     .u8(0x01).u8(0x01).u8(0x01).u8(0x01)       // on-curve, 16-bit deltas
     .i16(100).i16(0).i16(400).i16(0)
     .i16(0).i16(700).i16(0).i16(-700)
     .u16(0);                                   // pad to 4
    return w.data();
}

std::vector<uint8_t> loca(uint32_t glyfLength) {
    SfntWriter w;
    w.u32(0).u32(0).u32(glyfLength).u32(glyfLength);
    return w.data();
}

// (3,1) format 4: U+0020 -> 2, U+0041 -> 1
std::vector<uint8_t> cmap() {
    SfntWriter w;
    w.u16(0).u16(1)
     .u16(3).u16(1).u32(12);
    w.u16(4).u16(40).u16(0)             // format, length, language
     .u16(6).u16(4).u16(1).u16(2)       // segCountX2, searchRange, entrySelector, rangeShift
     .u16(0x20).u16(0x41).u16(0xFFFF)   // endCode
     .u16(0)                            // reservedPad
     .u16(0x20).u16(0x41).u16(0xFFFF)   // startCode
     .i16(2 - 0x20).i16(1 - 0x41).i16(1)
     .u16(0).u16(0).u16(0);             // idRangeOffset
    return w.data();
}

struct NameRecord {
    uint16_t platform;
    uint16_t encoding;
    uint16_t language;
    uint16_t nameId;
    std::vector<uint8_t> string;
};

std::vector<uint8_t> macRoman(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// ASCII plus code points above the BMP as surrogate pairs
std::vector<uint8_t> utf16Be(const std::vector<uint32_t>& codepoints) {
    SfntWriter w;
    for (uint32_t cp : codepoints) {
        if (cp >= 0x10000) {
            uint32_t v = cp - 0x10000;
            w.u16(static_cast<uint16_t>(0xD800 + (v >> 10)));
            w.u16(static_cast<uint16_t>(0xDC00 + (v & 0x3FF)));
        } else {
            w.u16(static_cast<uint16_t>(cp));
        }
    }
    return w.data();
}

std::vector<uint8_t> utf16Be(const std::string& ascii) {
    return utf16Be(std::vector<uint32_t>(ascii.begin(), ascii.end()));
}

std::vector<uint8_t> name(bool variable) {
    const std::string family = "Fixture ";
    std::vector<uint32_t> fullName(family.begin(), family.end());
    fullName.push_back(0x1F600);

    // Sorted by platform, encoding, language, name id
    std::vector<NameRecord> records = {
        {1, 0, 0, 1, macRoman("Fixture")},
        {3, 1, 0x0409, 1, utf16Be("Fixture")},
        {3, 1, 0x0409, 2, utf16Be("Regular")},
        {3, 1, 0x0409, 4, utf16Be(fullName)},
    };
    if (variable) {
        records.push_back({3, 1, 0x0409, 256, utf16Be("Weight")});
        records.push_back({3, 1, 0x0409, 257, utf16Be("Bold")});
    }

    SfntWriter w;
    w.u16(0)
     .u16(static_cast<uint16_t>(records.size()))
     .u16(static_cast<uint16_t>(6 + 12 * records.size()));

    SfntWriter storage;
    for (const auto& r : records) {
        w.u16(r.platform).u16(r.encoding).u16(r.language).u16(r.nameId)
         .u16(static_cast<uint16_t>(r.string.size()))
         .u16(static_cast<uint16_t>(storage.size()));
        storage.bytes(r.string);
    }
    w.bytes(storage.data());
    return w.data();
}

// Format 3: no glyph names
std::vector<uint8_t> post() {
    SfntWriter w;
    w.u32(0x00030000)
     .fixed(0.0)
     .i16(-100).i16(50)
     .u32(0)
     .u32(0).u32(0).u32(0).u32(0);
    return w.data();
}

std::vector<uint8_t> fvar() {
    SfntWriter w;
    w.u32(0x00010000)
     .u16(16)       // axesArrayOffset
     .u16(2)        // reserved
     .u16(1)        // axisCount
     .u16(20)       // axisSize
     .u16(1)        // instanceCount
     .u16(8);       // instanceSize
    w.tag("wght").fixed(100).fixed(400).fixed(900).u16(0).u16(256);
    w.u16(257).u16(0).fixed(700);
    return w.data();
}

// One axis, no variation data for any glyph
std::vector<uint8_t> gvar() {
    const uint32_t dataOffset = 20 + 2 * (NUM_GLYPHS + 1);
    SfntWriter w;
    w.u32(0x00010000)
     .u16(1)                // axisCount
     .u16(0)                // sharedTupleCount
     .u32(dataOffset)       // sharedTuplesOffset
     .u16(NUM_GLYPHS)
     .u16(0)                // flags: short offsets
     .u32(dataOffset);
    for (int i = 0; i <= NUM_GLYPHS; ++i) w.u16(0);
    return w.data();
}

SfntBuilder baseFont(bool variable) {
    std::vector<uint8_t> glyphData = glyf();
    uint32_t glyfLength = static_cast<uint32_t>(glyphData.size());

    SfntBuilder builder;
    builder.addTable("head", head());
    builder.addTable("hhea", hhea());
    builder.addTable("maxp", maxp());
    builder.addTable("OS/2", os2());
    builder.addTable("hmtx", hmtx());
    builder.addTable("loca", loca(glyfLength));
    builder.addTable("glyf", std::move(glyphData));
    builder.addTable("cmap", cmap());
    builder.addTable("name", name(variable));
    builder.addTable("post", post());
    builder.addTable("TEST", {0x01, 0x02, 0x03, 0xFA});
    return builder;
}

} // namespace

std::vector<uint8_t> buildStaticFont() {
    return baseFont(false).build();
}

std::vector<uint8_t> buildVariableFont() {
    SfntBuilder builder = baseFont(true);
    builder.addTable("fvar", fvar());
    builder.addTable("gvar", gvar());
    return builder.build();
}

} // namespace fontdiff::test
