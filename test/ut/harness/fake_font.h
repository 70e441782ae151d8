#pragma once

//=============================================================================
// Fake font and shaper for testing
//
// A FontSource built in memory: glyphs are rectangles in font units, tables
// are value trees set by the test. The shaper maps one codepoint to one
// glyph through the fake cmap with no kerning or mark positioning.
//=============================================================================

#include <fontdiff/font-source.h>
#include <fontdiff/shaper.h>

#include <map>
#include <set>
#include <string>
#include <vector>

namespace fontdiff::test {

class FakeFont;

//-----------------------------------------------------------------------------
// FakeShaper
//-----------------------------------------------------------------------------
class FakeShaper : public Shaper {
public:
    explicit FakeShaper(const FakeFont& font) : _font(font) {}

    std::vector<GlyphPosition> shape(Direction direction,
                                     const std::string& scriptTag,
                                     const std::string& text) const override;

    // Test inspection
    int calls() const { return _calls; }
    Direction lastDirection() const { return _lastDirection; }
    const std::string& lastScript() const { return _lastScript; }

private:
    const FakeFont& _font;
    mutable int _calls = 0;
    mutable Direction _lastDirection = Direction::LeftToRight;
    mutable std::string _lastScript;
};

//-----------------------------------------------------------------------------
// FakeFont - upem 1000, ascender 800, descender -200 unless changed
//-----------------------------------------------------------------------------
class FakeFont : public FontSource {
public:
    explicit FakeFont(std::string name = "Fake Sans");
    ~FakeFont() override = default;

    // Map codepoint to a new glyph covering [x0, x1] x [y0, y1]; returns its id
    uint32_t addRectGlyph(uint32_t codepoint, float x0, float y0, float x1, float y1,
                          double advance);

    // Map codepoint to a new glyph without contours (a space)
    uint32_t addBlankGlyph(uint32_t codepoint, double advance);

    // Map codepoint to an arbitrary glyph record
    uint32_t addGlyph(uint32_t codepoint, GlyphRecord record);

    // Drop a codepoint from the cmap; its glyph stays loadable
    void removeCodepoint(uint32_t codepoint);

    // Codepoint claimed by the cmap that the shaper turns into notdef
    void addUnshapedCodepoint(uint32_t codepoint);

    // loadGlyph(glyphId) fails from now on
    void failGlyph(uint32_t glyphId) { _failingGlyphs.insert(glyphId); }

    // Shaping `text` produces no glyphs at all
    void shapeToNothing(const std::string& text) { _unshapeable.insert(text); }

    // Glyph offset emitted by the shaper for codepoint
    void setOffset(uint32_t codepoint, int32_t x, int32_t y) { _offsets[codepoint] = {x, y}; }

    void setTable(const std::string& tag, Value value);
    void setTableError(const std::string& tag, std::string message);
    void removeTable(const std::string& tag);

    void setMetrics(const FontMetrics& metrics) { _metrics = metrics; }
    void addAxis(const AxisInfo& axis) { _axes.push_back(axis); }
    void addInstance(const NamedInstance& instance) { _instances.push_back(instance); }

    // FontSource
    const std::string& name() const override { return _name; }
    std::vector<std::string> tableNames() const override;
    Result<Value> decodeTable(const std::string& tag) const override;
    const std::set<uint32_t>& codepoints() const override { return _codepoints; }
    std::vector<AxisInfo> axes() const override { return _axes; }
    std::vector<NamedInstance> namedInstances() const override { return _instances; }
    Result<void> setLocation(const Location& location) override;
    const Location& location() const override { return _location; }
    FontMetrics metrics() const override { return _metrics; }
    Result<GlyphRecord> loadGlyph(uint32_t glyphId) const override;
    Result<Shaper::Ptr> createShaper() const override;

    // Test inspection
    int glyphLoads() const { return _glyphLoads; }
    const std::shared_ptr<FakeShaper>& shaper() const { return _shaper; }

private:
    friend class FakeShaper;

    struct Offset {
        int32_t x = 0;
        int32_t y = 0;
    };

    std::string _name;
    FontMetrics _metrics;
    std::vector<GlyphRecord> _glyphs;  // index 0 is notdef
    std::map<uint32_t, uint32_t> _cmap;
    std::set<uint32_t> _codepoints;
    std::set<uint32_t> _failingGlyphs;
    std::set<std::string> _unshapeable;
    std::map<uint32_t, Offset> _offsets;
    std::map<std::string, Result<Value>> _tables;
    std::vector<std::string> _tableOrder;
    std::vector<AxisInfo> _axes;
    std::vector<NamedInstance> _instances;
    Location _location;
    mutable int _glyphLoads = 0;
    mutable std::shared_ptr<FakeShaper> _shaper;
};

} // namespace fontdiff::test
