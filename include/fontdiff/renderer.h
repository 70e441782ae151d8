#pragma once

#include <fontdiff/font-source.h>
#include <fontdiff/glyph-cache.h>
#include <fontdiff/gray-image.h>
#include <fontdiff/shaper.h>

#include <optional>
#include <string>

namespace fontdiff {

struct Rendering {
    // "gid=36,position=0,0|gid=72,position=0,0"
    std::string trace;
    GrayImage image;
};

/**
 * Renderer - shapes probe strings with one font and rasterizes them.
 *
 * render() returns nullopt whenever the font cannot represent the probe:
 * a character outside the font's cmap, a notdef glyph in the shaped output,
 * an empty shaping result or a glyph that fails to load. A rendering that
 * came out blank is still returned.
 *
 * Canvas: width reaches the end of the last glyph's advance, height is
 * 1.2 x font size, baseline sits at ascender x scale from the top where
 * scale = font size / (ascender - descender).
 */
class Renderer {
public:
    Renderer(const FontSource& font, Shaper::Ptr shaper, float fontSize);

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    std::optional<Rendering> render(Direction direction,
                                    const std::string& scriptTag,
                                    const std::string& text);

    float fontSize() const { return _fontSize; }
    float scale() const { return _scale; }
    const GlyphCache& cache() const { return _cache; }

private:
    bool covers(const std::string& text) const;

    const FontSource& _font;
    Shaper::Ptr _shaper;
    float _fontSize;
    float _scale;
    float _ascender;
    GlyphCache _cache;
};

} // namespace fontdiff
