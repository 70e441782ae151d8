#pragma once

#include <fontdiff/gray-image.h>
#include <fontdiff/outline.h>
#include <fontdiff/result.hpp>

namespace fontdiff {

// Where and how large an outline is drawn on a canvas
struct Placement {
    float x = 0.0f;         // glyph origin, pixels from the left edge
    float baseline = 0.0f;  // baseline, pixels from the top edge
    float scale = 1.0f;     // pixels per font unit
};

/**
 * Rasterize an outline into the canvas with FreeType's anti-aliasing
 * scan converter (non-zero winding), then threshold every pixel:
 * coverage >= 0.5 adds full intensity with a saturating add, lower coverage
 * adds nothing. Pixels outside the canvas are dropped.
 */
Result<void> rasterize(const Outline& outline, const Placement& placement, GrayImage& canvas);

} // namespace fontdiff
