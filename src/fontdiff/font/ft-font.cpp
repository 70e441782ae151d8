#include <fontdiff/font/ft-font.h>
#include <fontdiff/font/freetype.h>
#include <fontdiff/font/hb-shaper.h>

#include "ft-tables.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H
#include FT_MULTIPLE_MASTERS_H

#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>

namespace fontdiff::font {

class FtFontImpl : public FtFont {
public:
    FtFontImpl(std::vector<uint8_t> data, std::string label)
        : _data(std::make_shared<const std::vector<uint8_t>>(std::move(data))),
          _label(std::move(label)) {}

    ~FtFontImpl() override {
        if (_face) FT_Done_Face(_face);
    }

    Result<void> init() {
        if (!ftLibrary()) {
            return Err("FreeType library not initialized");
        }
        FT_Error err = FT_New_Memory_Face(ftLibrary(),
                                          _data->data(),
                                          static_cast<FT_Long>(_data->size()),
                                          0, &_face);
        if (err) {
            return Err(_label + ": " + ftErrorString(err));
        }
        if (!FT_IS_SFNT(_face)) {
            return Err(_label + ": not an OpenType/TrueType font");
        }
        if (!FT_IS_SCALABLE(_face) || _face->units_per_EM == 0) {
            return Err(_label + ": font has no scalable outlines");
        }

        if (FT_Select_Charmap(_face, FT_ENCODING_UNICODE)) {
            ywarn("{}: no Unicode charmap", _label);
        }

        // One pixel per font unit: outlines come back in 26.6 font units
        err = FT_Set_Char_Size(_face, 0, static_cast<FT_F26Dot6>(_face->units_per_EM) * 64, 72, 72);
        if (err) {
            return Err(_label + ": cannot size face: " + ftErrorString(err));
        }

        _familyName = _face->family_name ? _face->family_name : "Unknown";

        if (_face->charmap) {
            FT_UInt gid = 0;
            FT_ULong cp = FT_Get_First_Char(_face, &gid);
            while (gid != 0) {
                _codepoints.insert(static_cast<uint32_t>(cp));
                cp = FT_Get_Next_Char(_face, cp, &gid);
            }
        }

        loadAxes();

        ydebug("{}: '{}' {} glyphs, {} codepoints, {} axes", _label, _familyName,
               _face->num_glyphs, _codepoints.size(), _axes.size());
        return Ok();
    }

    //-------------------------------------------------------------------------
    // FtFont
    //-------------------------------------------------------------------------

    const std::string& label() const override { return _label; }
    const std::string& familyName() const override { return _familyName; }
    bool isVariable() const override { return !_axes.empty(); }

    bool isColor() const override {
        static const char* colorTables[] = {"COLR", "SVG ", "CBDT", "sbix"};
        for (const char* tag : colorTables) {
            FT_ULong length = 0;
            if (FT_Load_Sfnt_Table(_face, stringToTag(tag), 0, nullptr, &length) == 0) {
                return true;
            }
        }
        return false;
    }

    //-------------------------------------------------------------------------
    // FontSource
    //-------------------------------------------------------------------------

    const std::string& name() const override { return _familyName; }

    std::vector<std::string> tableNames() const override {
        std::vector<std::string> names;
        FT_ULong count = 0;
        if (FT_Sfnt_Table_Info(_face, 0, nullptr, &count)) {
            return names;
        }
        for (FT_UInt i = 0; i < count; ++i) {
            FT_ULong tag = 0;
            FT_ULong length = 0;
            if (FT_Sfnt_Table_Info(_face, i, &tag, &length) == 0) {
                names.push_back(tagToString(tag));
            }
        }
        return names;
    }

    Result<Value> decodeTable(const std::string& tag) const override {
        if (tag == "head") return decodeHead(_face);
        if (tag == "hhea") return decodeHhea(_face);
        if (tag == "vhea") return decodeVhea(_face);
        if (tag == "maxp") return decodeMaxp(_face);
        if (tag == "OS/2") return decodeOs2(_face);
        if (tag == "post") return decodePost(_face);
        if (tag == "name") return decodeName(_face);
        if (tag == "fvar") return decodeFvar(_face);
        if (tag == "cmap") return decodeCmap(_face);
        return decodeRaw(_face, tag);
    }

    const std::set<uint32_t>& codepoints() const override { return _codepoints; }

    std::vector<AxisInfo> axes() const override { return _axes; }
    std::vector<NamedInstance> namedInstances() const override { return _instances; }

    Result<void> setLocation(const Location& location) override {
        std::vector<FT_Fixed> coords;
        coords.reserve(_axes.size());
        for (const auto& axis : _axes) {
            coords.push_back(static_cast<FT_Fixed>(axis.defaultValue * 65536.0));
        }

        Location applied;
        for (const auto& setting : location) {
            auto it = std::find_if(_axes.begin(), _axes.end(),
                                   [&](const AxisInfo& a) { return a.tag == setting.tag; });
            if (it == _axes.end()) {
                return Err(_label + ": no axis '" + setting.tag + "'");
            }
            double value = std::clamp(setting.value, it->minimum, it->maximum);
            if (value != setting.value) {
                ywarn("{}: {}={} outside [{}, {}], clamped to {}", _label, setting.tag,
                      setting.value, it->minimum, it->maximum, value);
            }
            coords[static_cast<size_t>(it - _axes.begin())] =
                static_cast<FT_Fixed>(value * 65536.0);
            applied.push_back({setting.tag, value});
        }

        if (!coords.empty()) {
            FT_Error err = FT_Set_Var_Design_Coordinates(
                _face, static_cast<FT_UInt>(coords.size()), coords.data());
            if (err) {
                return Err(_label + ": cannot set variation: " + ftErrorString(err));
            }
        }
        _location = std::move(applied);
        return Ok();
    }

    const Location& location() const override { return _location; }

    FontMetrics metrics() const override {
        FontMetrics m;
        m.unitsPerEm = _face->units_per_EM;
        auto* hhea = static_cast<TT_HoriHeader*>(FT_Get_Sfnt_Table(_face, FT_SFNT_HHEA));
        if (hhea && (hhea->Ascender != 0 || hhea->Descender != 0)) {
            m.ascender = hhea->Ascender;
            m.descender = hhea->Descender;
        } else {
            m.ascender = _face->ascender;
            m.descender = _face->descender;
        }
        return m;
    }

    Result<GlyphRecord> loadGlyph(uint32_t glyphId) const override {
        FT_Error err = FT_Load_Glyph(_face, glyphId, FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP);
        if (err) {
            return Err<GlyphRecord>("glyph " + std::to_string(glyphId) + ": " +
                                    ftErrorString(err));
        }

        FT_GlyphSlot slot = _face->glyph;
        GlyphRecord record;
        record.advance = slot->metrics.horiAdvance / 64.0;
        record.leftSideBearing = slot->metrics.horiBearingX / 64.0;

        if (slot->format != FT_GLYPH_FORMAT_OUTLINE) {
            return Err<GlyphRecord>("glyph " + std::to_string(glyphId) + ": not an outline");
        }

        const FT_Outline& src = slot->outline;
        if (src.n_contours <= 0) {
            return Ok(std::move(record));
        }

        Outline outline;
        int first = 0;
        for (int c = 0; c < src.n_contours; ++c) {
            int last = src.contours[c];
            std::vector<Point> points;
            std::vector<uint8_t> tags;
            points.reserve(static_cast<size_t>(last - first + 1));
            tags.reserve(static_cast<size_t>(last - first + 1));
            for (int i = first; i <= last; ++i) {
                points.push_back({src.points[i].x / 64.0f, src.points[i].y / 64.0f});
                tags.push_back(static_cast<uint8_t>(FT_CURVE_TAG(src.tags[i])));
            }
            outline.addContour(points, tags);
            first = last + 1;
        }
        record.outline = std::move(outline);
        return Ok(std::move(record));
    }

    Result<Shaper::Ptr> createShaper() const override {
        auto shaper = HbShaper::create(_data, _location);
        if (!shaper) {
            return Err<Shaper::Ptr>(_label, shaper);
        }
        return shaper;
    }

private:
    void loadAxes() {
        if (!FT_HAS_MULTIPLE_MASTERS(_face)) return;

        FT_MM_Var* mm = nullptr;
        if (FT_Error err = FT_Get_MM_Var(_face, &mm)) {
            ywarn("{}: cannot read variation axes: {}", _label, ftErrorString(err));
            return;
        }

        for (FT_UInt i = 0; i < mm->num_axis; ++i) {
            const FT_Var_Axis& a = mm->axis[i];
            AxisInfo axis;
            axis.tag = tagToString(a.tag);
            axis.name = nameString(_face, a.strid);
            if (axis.name.empty() && a.name) axis.name = a.name;
            axis.minimum = a.minimum / 65536.0;
            axis.defaultValue = a.def / 65536.0;
            axis.maximum = a.maximum / 65536.0;
            _axes.push_back(std::move(axis));
        }

        for (FT_UInt i = 0; i < mm->num_namedstyles; ++i) {
            const FT_Var_Named_Style& style = mm->namedstyle[i];
            NamedInstance instance;
            instance.name = nameString(_face, style.strid);
            for (FT_UInt j = 0; j < mm->num_axis; ++j) {
                instance.location.push_back({_axes[j].tag, style.coords[j] / 65536.0});
            }
            _instances.push_back(std::move(instance));
        }

        FT_Done_MM_Var(ftLibrary(), mm);
    }

    std::shared_ptr<const std::vector<uint8_t>> _data;
    std::string _label;
    std::string _familyName;
    FT_Face _face = nullptr;
    std::set<uint32_t> _codepoints;
    std::vector<AxisInfo> _axes;
    std::vector<NamedInstance> _instances;
    Location _location;
};

Result<FtFont::Ptr> FtFont::create(std::vector<uint8_t> data, std::string label) {
    auto impl = std::make_shared<FtFontImpl>(std::move(data), std::move(label));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("FtFont creation failed", res);
    }
    return Ok(Ptr(std::move(impl)));
}

Result<FtFont::Ptr> FtFont::open(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<Ptr>("cannot open " + path.string());
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (data.empty()) {
        return Err<Ptr>(path.string() + " is empty");
    }
    return create(std::move(data), path.filename().string());
}

} // namespace fontdiff::font
