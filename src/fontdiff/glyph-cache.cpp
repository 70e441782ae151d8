#include <fontdiff/glyph-cache.h>

#include <ytrace/ytrace.hpp>

namespace fontdiff {

const GlyphRecord* GlyphCache::get(uint32_t glyphId) {
    auto it = _glyphs.find(glyphId);
    if (it == _glyphs.end()) {
        ++_loads;
        auto res = _font.loadGlyph(glyphId);
        if (!res) {
            ywarn("{}: glyph {} failed to load: {}", _font.name(), glyphId, error_msg(res));
            it = _glyphs.emplace(glyphId, std::nullopt).first;
        } else {
            it = _glyphs.emplace(glyphId, std::move(*res)).first;
        }
    }
    return it->second ? &*it->second : nullptr;
}

} // namespace fontdiff
