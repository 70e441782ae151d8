#include <fontdiff/compare.h>

#include <algorithm>

namespace fontdiff {

const char* categoryName(Category category) {
    switch (category) {
        case Category::Missing:  return "missing";
        case Category::New:      return "new";
        case Category::Modified: return "modified";
    }
    return "unknown";
}

double percentDifference(const GrayImage& a, const GrayImage& b) {
    const uint32_t width = std::max(a.width(), b.width());
    const uint32_t height = std::max(a.height(), b.height());
    const size_t total = static_cast<size_t>(width) * height;
    if (total == 0) return 0.0;

    const uint32_t overlapW = std::min(a.width(), b.width());
    const uint32_t overlapH = std::min(a.height(), b.height());

    size_t differing = total - static_cast<size_t>(overlapW) * overlapH;
    for (uint32_t y = 0; y < overlapH; ++y) {
        for (uint32_t x = 0; x < overlapW; ++x) {
            if (a.at(x, y) != b.at(x, y)) ++differing;
        }
    }
    return 100.0 * static_cast<double>(differing) / static_cast<double>(total);
}

std::optional<Comparison> compareRenderings(const std::optional<Rendering>& a,
                                            const std::optional<Rendering>& b) {
    if (!a && !b) return std::nullopt;
    if (a && !b) return Comparison{Category::Missing, 100.0};
    if (!a && b) return Comparison{Category::New, 100.0};

    double percent = percentDifference(a->image, b->image);
    if (percent <= 0.0) return std::nullopt;
    return Comparison{Category::Modified, percent};
}

} // namespace fontdiff
