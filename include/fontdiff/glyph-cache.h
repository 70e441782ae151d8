#pragma once

#include <fontdiff/font-source.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace fontdiff {

/**
 * GlyphCache - per-run memo of glyph metrics and outlines, keyed by glyph id.
 *
 * Owned by exactly one Renderer. Not synchronized: a lookup is a
 * check-then-insert sequence, so each thread needs its own cache.
 * Failed loads are cached too and report nullptr on every lookup.
 */
class GlyphCache {
public:
    explicit GlyphCache(const FontSource& font) : _font(font) {}

    GlyphCache(const GlyphCache&) = delete;
    GlyphCache& operator=(const GlyphCache&) = delete;

    const GlyphRecord* get(uint32_t glyphId);

    size_t size() const { return _glyphs.size(); }
    size_t loads() const { return _loads; }

private:
    const FontSource& _font;
    std::unordered_map<uint32_t, std::optional<GlyphRecord>> _glyphs;
    size_t _loads = 0;
};

} // namespace fontdiff
