#include <fontdiff/renderer.h>
#include <fontdiff/rasterizer.h>
#include <fontdiff/unicode.h>

#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <vector>

namespace fontdiff {

namespace {

struct PlacedGlyph {
    const GlyphRecord* record;
    float x;
    float baseline;
};

} // namespace

Renderer::Renderer(const FontSource& font, Shaper::Ptr shaper, float fontSize)
    : _font(font), _shaper(std::move(shaper)), _fontSize(fontSize), _cache(font) {
    FontMetrics m = font.metrics();
    double height = m.ascender - m.descender;
    if (height <= 0.0) height = m.unitsPerEm;
    _scale = static_cast<float>(fontSize / height);
    _ascender = static_cast<float>(m.ascender);
}

bool Renderer::covers(const std::string& text) const {
    const auto& cmap = _font.codepoints();
    for (uint32_t cp : unicode::decodeUtf8(text)) {
        if (!cmap.count(cp)) return false;
    }
    return true;
}

std::optional<Rendering> Renderer::render(Direction direction,
                                          const std::string& scriptTag,
                                          const std::string& text) {
    if (!covers(text)) {
        return std::nullopt;
    }

    std::vector<GlyphPosition> shaped = _shaper->shape(direction, scriptTag, text);
    if (shaped.empty()) {
        return std::nullopt;
    }

    std::vector<PlacedGlyph> placed;
    placed.reserve(shaped.size());
    for (const auto& pos : shaped) {
        if (pos.glyphId == NOTDEF_GLYPH) {
            return std::nullopt;
        }
        const GlyphRecord* record = _cache.get(pos.glyphId);
        if (!record) {
            return std::nullopt;
        }
        placed.push_back({record, 0.0f, 0.0f});
    }

    // Start at the side bearing of the first glyph that advances, so leading
    // marks are not pushed off the left edge
    float cursor = 0.0f;
    for (size_t i = 0; i < shaped.size(); ++i) {
        if (shaped[i].xAdvance > 0) {
            cursor = static_cast<float>(placed[i].record->leftSideBearing) * _scale;
            break;
        }
    }

    std::string trace;
    for (size_t i = 0; i < shaped.size(); ++i) {
        const auto& pos = shaped[i];
        placed[i].x = cursor + static_cast<float>(pos.xOffset) * _scale;
        placed[i].baseline = (_ascender - static_cast<float>(pos.yOffset)) * _scale;

        if (!trace.empty()) trace += '|';
        trace += "gid=" + std::to_string(pos.glyphId) +
                 ",position=" + std::to_string(pos.xOffset) +
                 "," + std::to_string(pos.yOffset);

        cursor += static_cast<float>(pos.xAdvance) * _scale;
    }

    const PlacedGlyph& last = placed.back();
    float right = last.x + static_cast<float>(last.record->advance) * _scale;
    auto width = static_cast<uint32_t>(std::max(0.0f, right));
    auto height = static_cast<uint32_t>(_fontSize * 1.2f);

    Rendering rendering;
    rendering.trace = std::move(trace);
    rendering.image = GrayImage(width, height);

    for (const auto& glyph : placed) {
        if (!glyph.record->outline) continue;
        Placement placement{glyph.x, glyph.baseline, _scale};
        if (auto res = rasterize(*glyph.record->outline, placement, rendering.image); !res) {
            ywarn("{}: cannot rasterize '{}': {}", _font.name(), text, error_msg(res));
            return std::nullopt;
        }
    }

    return rendering;
}

} // namespace fontdiff
