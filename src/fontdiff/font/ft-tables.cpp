#include "ft-tables.h"

#include <fontdiff/font/freetype.h>
#include <fontdiff/unicode.h>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H
#include FT_TRUETYPE_IDS_H
#include FT_SFNT_NAMES_H
#include FT_MULTIPLE_MASTERS_H

#include <cstdio>
#include <map>
#include <vector>

namespace fontdiff::font {

std::string tagToString(unsigned long tag) {
    std::string s(4, ' ');
    s[0] = static_cast<char>((tag >> 24) & 0xFF);
    s[1] = static_cast<char>((tag >> 16) & 0xFF);
    s[2] = static_cast<char>((tag >> 8) & 0xFF);
    s[3] = static_cast<char>(tag & 0xFF);
    return s;
}

unsigned long stringToTag(const std::string& tag) {
    unsigned long value = 0;
    for (size_t i = 0; i < 4; ++i) {
        unsigned char c = i < tag.size() ? static_cast<unsigned char>(tag[i]) : ' ';
        value = (value << 8) | c;
    }
    return value;
}

static double fixedToDouble(FT_Fixed v) {
    return static_cast<double>(v) / 65536.0;
}

// LONGDATETIME split by FreeType into two 32-bit halves
static double longDateTime(const FT_ULong parts[2]) {
    int64_t value = (static_cast<int64_t>(parts[0] & 0xFFFFFFFF) << 32) |
                    static_cast<int64_t>(parts[1] & 0xFFFFFFFF);
    return static_cast<double>(value);
}

//=============================================================================
// Fixed-layout tables
//=============================================================================

Result<Value> decodeHead(FT_Face face) {
    auto* head = static_cast<TT_Header*>(FT_Get_Sfnt_Table(face, FT_SFNT_HEAD));
    if (!head) return Err<Value>("head: table not loaded");

    Object o;
    o.insert("version", fixedToDouble(head->Table_Version));
    o.insert("font_revision", fixedToDouble(head->Font_Revision));
    o.insert("checksum_adjustment", head->CheckSum_Adjust & 0xFFFFFFFF);
    o.insert("magic_number", head->Magic_Number & 0xFFFFFFFF);
    o.insert("flags", head->Flags);
    o.insert("units_per_em", head->Units_Per_EM);
    o.insert("created", longDateTime(head->Created));
    o.insert("modified", longDateTime(head->Modified));
    o.insert("x_min", head->xMin);
    o.insert("y_min", head->yMin);
    o.insert("x_max", head->xMax);
    o.insert("y_max", head->yMax);
    o.insert("mac_style", head->Mac_Style);
    o.insert("lowest_rec_ppem", head->Lowest_Rec_PPEM);
    o.insert("font_direction_hint", head->Font_Direction);
    o.insert("index_to_loc_format", head->Index_To_Loc_Format);
    o.insert("glyph_data_format", head->Glyph_Data_Format);
    return Ok(Value(std::move(o)));
}

Result<Value> decodeHhea(FT_Face face) {
    auto* hhea = static_cast<TT_HoriHeader*>(FT_Get_Sfnt_Table(face, FT_SFNT_HHEA));
    if (!hhea) return Err<Value>("hhea: table not loaded");

    Object o;
    o.insert("version", fixedToDouble(hhea->Version));
    o.insert("ascender", hhea->Ascender);
    o.insert("descender", hhea->Descender);
    o.insert("line_gap", hhea->Line_Gap);
    o.insert("advance_width_max", hhea->advance_Width_Max);
    o.insert("min_left_side_bearing", hhea->min_Left_Side_Bearing);
    o.insert("min_right_side_bearing", hhea->min_Right_Side_Bearing);
    o.insert("x_max_extent", hhea->xMax_Extent);
    o.insert("caret_slope_rise", hhea->caret_Slope_Rise);
    o.insert("caret_slope_run", hhea->caret_Slope_Run);
    o.insert("caret_offset", hhea->caret_Offset);
    o.insert("metric_data_format", hhea->metric_Data_Format);
    o.insert("number_of_h_metrics", hhea->number_Of_HMetrics);
    return Ok(Value(std::move(o)));
}

Result<Value> decodeVhea(FT_Face face) {
    auto* vhea = static_cast<TT_VertHeader*>(FT_Get_Sfnt_Table(face, FT_SFNT_VHEA));
    if (!vhea) return Err<Value>("vhea: table not loaded");

    Object o;
    o.insert("version", fixedToDouble(vhea->Version));
    o.insert("ascender", vhea->Ascender);
    o.insert("descender", vhea->Descender);
    o.insert("line_gap", vhea->Line_Gap);
    o.insert("advance_height_max", vhea->advance_Height_Max);
    o.insert("min_top_side_bearing", vhea->min_Top_Side_Bearing);
    o.insert("min_bottom_side_bearing", vhea->min_Bottom_Side_Bearing);
    o.insert("y_max_extent", vhea->yMax_Extent);
    o.insert("caret_slope_rise", vhea->caret_Slope_Rise);
    o.insert("caret_slope_run", vhea->caret_Slope_Run);
    o.insert("caret_offset", vhea->caret_Offset);
    o.insert("metric_data_format", vhea->metric_Data_Format);
    o.insert("number_of_long_ver_metrics", vhea->number_Of_VMetrics);
    return Ok(Value(std::move(o)));
}

Result<Value> decodeMaxp(FT_Face face) {
    auto* maxp = static_cast<TT_MaxProfile*>(FT_Get_Sfnt_Table(face, FT_SFNT_MAXP));
    if (!maxp) return Err<Value>("maxp: table not loaded");

    Object o;
    o.insert("version", fixedToDouble(maxp->version));
    o.insert("num_glyphs", maxp->numGlyphs);
    // Version 0.5 (CFF) stops here
    if (maxp->version >= 0x10000) {
        o.insert("max_points", maxp->maxPoints);
        o.insert("max_contours", maxp->maxContours);
        o.insert("max_composite_points", maxp->maxCompositePoints);
        o.insert("max_composite_contours", maxp->maxCompositeContours);
        o.insert("max_zones", maxp->maxZones);
        o.insert("max_twilight_points", maxp->maxTwilightPoints);
        o.insert("max_storage", maxp->maxStorage);
        o.insert("max_function_defs", maxp->maxFunctionDefs);
        o.insert("max_instruction_defs", maxp->maxInstructionDefs);
        o.insert("max_stack_elements", maxp->maxStackElements);
        o.insert("max_size_of_instructions", maxp->maxSizeOfInstructions);
        o.insert("max_component_elements", maxp->maxComponentElements);
        o.insert("max_component_depth", maxp->maxComponentDepth);
    }
    return Ok(Value(std::move(o)));
}

Result<Value> decodeOs2(FT_Face face) {
    auto* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (!os2 || os2->version == 0xFFFF) return Err<Value>("OS/2: table not loaded");

    Object o;
    o.insert("version", os2->version);
    o.insert("x_avg_char_width", os2->xAvgCharWidth);
    o.insert("us_weight_class", os2->usWeightClass);
    o.insert("us_width_class", os2->usWidthClass);
    o.insert("fs_type", os2->fsType);
    o.insert("y_subscript_x_size", os2->ySubscriptXSize);
    o.insert("y_subscript_y_size", os2->ySubscriptYSize);
    o.insert("y_subscript_x_offset", os2->ySubscriptXOffset);
    o.insert("y_subscript_y_offset", os2->ySubscriptYOffset);
    o.insert("y_superscript_x_size", os2->ySuperscriptXSize);
    o.insert("y_superscript_y_size", os2->ySuperscriptYSize);
    o.insert("y_superscript_x_offset", os2->ySuperscriptXOffset);
    o.insert("y_superscript_y_offset", os2->ySuperscriptYOffset);
    o.insert("y_strikeout_size", os2->yStrikeoutSize);
    o.insert("y_strikeout_position", os2->yStrikeoutPosition);
    o.insert("s_family_class", os2->sFamilyClass);

    Array panose;
    for (FT_Byte b : os2->panose) panose.emplace_back(b);
    o.insert("panose_10", std::move(panose));

    o.insert("ul_unicode_range_1", os2->ulUnicodeRange1 & 0xFFFFFFFF);
    o.insert("ul_unicode_range_2", os2->ulUnicodeRange2 & 0xFFFFFFFF);
    o.insert("ul_unicode_range_3", os2->ulUnicodeRange3 & 0xFFFFFFFF);
    o.insert("ul_unicode_range_4", os2->ulUnicodeRange4 & 0xFFFFFFFF);

    std::string vendor;
    for (FT_Char c : os2->achVendID) vendor += static_cast<char>(c);
    o.insert("ach_vend_id", vendor);

    o.insert("fs_selection", os2->fsSelection);
    o.insert("us_first_char_index", os2->usFirstCharIndex);
    o.insert("us_last_char_index", os2->usLastCharIndex);
    o.insert("s_typo_ascender", os2->sTypoAscender);
    o.insert("s_typo_descender", os2->sTypoDescender);
    o.insert("s_typo_line_gap", os2->sTypoLineGap);
    o.insert("us_win_ascent", os2->usWinAscent);
    o.insert("us_win_descent", os2->usWinDescent);

    if (os2->version >= 1) {
        o.insert("ul_code_page_range_1", os2->ulCodePageRange1 & 0xFFFFFFFF);
        o.insert("ul_code_page_range_2", os2->ulCodePageRange2 & 0xFFFFFFFF);
    }
    if (os2->version >= 2) {
        o.insert("sx_height", os2->sxHeight);
        o.insert("s_cap_height", os2->sCapHeight);
        o.insert("us_default_char", os2->usDefaultChar);
        o.insert("us_break_char", os2->usBreakChar);
        o.insert("us_max_context", os2->usMaxContext);
    }
    if (os2->version >= 5) {
        o.insert("us_lower_optical_point_size", os2->usLowerOpticalPointSize);
        o.insert("us_upper_optical_point_size", os2->usUpperOpticalPointSize);
    }
    return Ok(Value(std::move(o)));
}

Result<Value> decodePost(FT_Face face) {
    auto* post = static_cast<TT_Postscript*>(FT_Get_Sfnt_Table(face, FT_SFNT_POST));
    if (!post) return Err<Value>("post: table not loaded");

    Object o;
    o.insert("version", fixedToDouble(post->FormatType));
    o.insert("italic_angle", fixedToDouble(post->italicAngle));
    o.insert("underline_position", post->underlinePosition);
    o.insert("underline_thickness", post->underlineThickness);
    o.insert("is_fixed_pitch", post->isFixedPitch & 0xFFFFFFFF);
    o.insert("min_mem_type42", post->minMemType42 & 0xFFFFFFFF);
    o.insert("max_mem_type42", post->maxMemType42 & 0xFFFFFFFF);
    o.insert("min_mem_type1", post->minMemType1 & 0xFFFFFFFF);
    o.insert("max_mem_type1", post->maxMemType1 & 0xFFFFFFFF);

    // Glyph names only exist for format 2
    if (FT_HAS_GLYPH_NAMES(face)) {
        Array names;
        char buffer[256];
        for (FT_Long gid = 0; gid < face->num_glyphs; ++gid) {
            if (FT_Get_Glyph_Name(face, static_cast<FT_UInt>(gid), buffer, sizeof(buffer))) {
                names.emplace_back(nullptr);
            } else {
                names.emplace_back(std::string(buffer));
            }
        }
        o.insert("glyph_names", std::move(names));
    }
    return Ok(Value(std::move(o)));
}

//=============================================================================
// name
//=============================================================================

std::string decodeUtf16Be(const uint8_t* data, size_t length) {
    std::string out;
    for (size_t i = 0; i + 1 < length; i += 2) {
        uint32_t unit = (static_cast<uint32_t>(data[i]) << 8) | data[i + 1];
        if (unit >= 0xD800 && unit <= 0xDFFF) {
            uint32_t low = 0;
            if (unit <= 0xDBFF && i + 3 < length) {
                low = (static_cast<uint32_t>(data[i + 2]) << 8) | data[i + 3];
            }
            if (low >= 0xDC00 && low <= 0xDFFF) {
                unit = 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
                i += 2;
            } else {
                unit = 0xFFFD;
            }
        }
        out += unicode::encodeUtf8(unit);
    }
    return out;
}

// Mac platform strings: ASCII is exact, the upper half is read as Latin-1
static std::string decodeSingleByte(const FT_Byte* data, FT_UInt length) {
    std::string out;
    for (FT_UInt i = 0; i < length; ++i) {
        out += unicode::encodeUtf8(data[i]);
    }
    return out;
}

static std::string decodeNameString(const FT_SfntName& entry) {
    if (entry.platform_id == TT_PLATFORM_MICROSOFT ||
        entry.platform_id == TT_PLATFORM_APPLE_UNICODE) {
        return decodeUtf16Be(entry.string, entry.string_len);
    }
    return decodeSingleByte(entry.string, entry.string_len);
}

// "win-0409", "mac-0", "unicode-0"
static std::string languageKey(const FT_SfntName& entry) {
    char buffer[32];
    switch (entry.platform_id) {
    case TT_PLATFORM_MICROSOFT:
        std::snprintf(buffer, sizeof(buffer), "win-%04X", entry.language_id);
        break;
    case TT_PLATFORM_MACINTOSH:
        std::snprintf(buffer, sizeof(buffer), "mac-%u", entry.language_id);
        break;
    case TT_PLATFORM_APPLE_UNICODE:
        std::snprintf(buffer, sizeof(buffer), "unicode-%u", entry.language_id);
        break;
    default:
        std::snprintf(buffer, sizeof(buffer), "platform%u-%u",
                      entry.platform_id, entry.language_id);
        break;
    }
    return buffer;
}

std::string nameString(FT_Face face, unsigned nameId) {
    FT_UInt count = FT_Get_Sfnt_Name_Count(face);
    std::string fallback;
    for (FT_UInt i = 0; i < count; ++i) {
        FT_SfntName entry;
        if (FT_Get_Sfnt_Name(face, i, &entry) || entry.name_id != nameId) continue;
        if (entry.platform_id == TT_PLATFORM_MICROSOFT &&
            entry.language_id == TT_MS_LANGID_ENGLISH_UNITED_STATES) {
            return decodeNameString(entry);
        }
        if (fallback.empty()) fallback = decodeNameString(entry);
    }
    return fallback;
}

Result<Value> decodeName(FT_Face face) {
    FT_UInt count = FT_Get_Sfnt_Name_Count(face);

    // name id -> language -> string, both sorted
    std::map<unsigned, std::map<std::string, std::string>> names;
    for (FT_UInt i = 0; i < count; ++i) {
        FT_SfntName entry;
        if (FT_Error err = FT_Get_Sfnt_Name(face, i, &entry)) {
            return Err<Value>("name: record " + std::to_string(i) + ": " + ftErrorString(err));
        }
        names[entry.name_id][languageKey(entry)] = decodeNameString(entry);
    }

    Object o;
    for (const auto& [nameId, languages] : names) {
        Object byLanguage;
        for (const auto& [language, text] : languages) {
            byLanguage.insert(language, text);
        }
        o.insert(std::to_string(nameId), std::move(byLanguage));
    }
    return Ok(Value(std::move(o)));
}

//=============================================================================
// fvar
//=============================================================================

Result<Value> decodeFvar(FT_Face face) {
    if (!FT_HAS_MULTIPLE_MASTERS(face)) return Err<Value>("fvar: font is not variable");

    FT_MM_Var* mm = nullptr;
    if (FT_Error err = FT_Get_MM_Var(face, &mm)) {
        return Err<Value>(std::string("fvar: ") + ftErrorString(err));
    }

    Array axes;
    for (FT_UInt i = 0; i < mm->num_axis; ++i) {
        const FT_Var_Axis& axis = mm->axis[i];
        Object a;
        a.insert("tag", tagToString(axis.tag));
        a.insert("name", nameString(face, axis.strid));
        a.insert("min", fixedToDouble(axis.minimum));
        a.insert("default", fixedToDouble(axis.def));
        a.insert("max", fixedToDouble(axis.maximum));
        axes.emplace_back(std::move(a));
    }

    Array instances;
    for (FT_UInt i = 0; i < mm->num_namedstyles; ++i) {
        const FT_Var_Named_Style& style = mm->namedstyle[i];
        Object coordinates;
        for (FT_UInt j = 0; j < mm->num_axis; ++j) {
            coordinates.insert(tagToString(mm->axis[j].tag), fixedToDouble(style.coords[j]));
        }
        Object inst;
        inst.insert("name", nameString(face, style.strid));
        inst.insert("coordinates", std::move(coordinates));
        instances.emplace_back(std::move(inst));
    }

    FT_Done_MM_Var(ftLibrary(), mm);

    Object o;
    o.insert("axes", std::move(axes));
    o.insert("instances", std::move(instances));
    return Ok(Value(std::move(o)));
}

//=============================================================================
// cmap
//=============================================================================

Result<Value> decodeCmap(FT_Face face) {
    if (!face->charmap) return Err<Value>("cmap: no Unicode charmap");

    Object o;
    FT_UInt gid = 0;
    FT_ULong cp = FT_Get_First_Char(face, &gid);
    while (gid != 0) {
        o.insert(unicode::formatCodepoint(static_cast<uint32_t>(cp)), gid);
        cp = FT_Get_Next_Char(face, cp, &gid);
    }
    return Ok(Value(std::move(o)));
}

//=============================================================================
// Everything else
//=============================================================================

Result<Value> decodeRaw(FT_Face face, const std::string& tag) {
    FT_ULong length = 0;
    FT_ULong ftTag = stringToTag(tag);
    if (FT_Error err = FT_Load_Sfnt_Table(face, ftTag, 0, nullptr, &length)) {
        return Err<Value>(tag + ": " + ftErrorString(err));
    }

    std::vector<FT_Byte> bytes(length);
    if (length > 0) {
        if (FT_Error err = FT_Load_Sfnt_Table(face, ftTag, 0, bytes.data(), &length)) {
            return Err<Value>(tag + ": " + ftErrorString(err));
        }
    }

    Array out;
    out.reserve(bytes.size());
    for (FT_Byte b : bytes) out.emplace_back(b);
    return Ok(Value(std::move(out)));
}

} // namespace fontdiff::font
