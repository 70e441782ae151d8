#pragma once

#include <fontdiff/gray-image.h>
#include <fontdiff/renderer.h>

#include <optional>

namespace fontdiff {

enum class Category {
    Missing,   // rendered by the old font only
    New,       // rendered by the new font only
    Modified,  // rendered by both, pixels differ
};

const char* categoryName(Category category);

/**
 * Percentage (0-100) of differing pixels over the union of both extents.
 * Inside the overlap a pixel differs when the intensities are not equal;
 * every pixel covered by only one of the images counts as differing.
 * Symmetric in its arguments; two empty images are identical.
 */
double percentDifference(const GrayImage& a, const GrayImage& b);

struct Comparison {
    Category category;
    double percent;
};

/**
 * Classify the renderings of one probe in the old (a) and new (b) font.
 * nullopt when neither font renders it or both render identical pixels.
 * Missing and New carry 100 percent.
 */
std::optional<Comparison> compareRenderings(const std::optional<Rendering>& a,
                                            const std::optional<Rendering>& b);

} // namespace fontdiff
