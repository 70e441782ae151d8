#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fontdiff {

enum class Direction {
    LeftToRight,
    RightToLeft,
};

// One shaped glyph. Offsets and advances are in font units.
struct GlyphPosition {
    uint32_t glyphId = 0;
    int32_t xOffset = 0;
    int32_t yOffset = 0;
    int32_t xAdvance = 0;
    int32_t yAdvance = 0;
};

// Glyph id the shaper emits for characters the font does not map
constexpr uint32_t NOTDEF_GLYPH = 0;

/**
 * Shaper - text shaping for one font at one variation location.
 *
 * scriptTag is an ISO 15924 tag ("Latn", "Arab"); empty lets the shaper
 * guess the script from the text.
 */
class Shaper {
public:
    using Ptr = std::shared_ptr<Shaper>;

    virtual ~Shaper() = default;

    virtual std::vector<GlyphPosition> shape(Direction direction,
                                             const std::string& scriptTag,
                                             const std::string& text) const = 0;
};

} // namespace fontdiff
