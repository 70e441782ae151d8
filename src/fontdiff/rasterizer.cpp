#include <fontdiff/rasterizer.h>
#include <fontdiff/font/freetype.h>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

#include <climits>
#include <cmath>
#include <string>
#include <type_traits>

namespace fontdiff {

namespace {

constexpr unsigned char COVERAGE_THRESHOLD = 128;

struct SpanContext {
    GrayImage* canvas;
    int height;
};

void blendSpans(int y, int count, const FT_Span* spans, void* user) {
    auto* ctx = static_cast<SpanContext*>(user);
    // FreeType scanlines grow upward, canvas rows grow downward
    int row = ctx->height - 1 - y;
    for (int i = 0; i < count; ++i) {
        const FT_Span& span = spans[i];
        if (span.coverage < COVERAGE_THRESHOLD) continue;
        for (int x = span.x; x < span.x + span.len; ++x) {
            ctx->canvas->accumulate(x, row, 255);
        }
    }
}

FT_Pos toF26Dot6(float v) {
    return static_cast<FT_Pos>(std::lround(v * 64.0f));
}

} // namespace

Result<void> rasterize(const Outline& outline, const Placement& placement, GrayImage& canvas) {
    if (outline.empty() || canvas.empty()) return Ok();

    const auto& points = outline.points();
    const auto& tags = outline.tags();
    const auto& ends = outline.contourEnds();

    if (points.size() > SHRT_MAX || ends.size() > SHRT_MAX) {
        return Err("rasterize: outline too large (" + std::to_string(points.size()) + " points)");
    }

    FT_Library lib = font::ftLibrary();
    FT_Outline ft{};
    FT_Error err = FT_Outline_New(lib, static_cast<FT_UInt>(points.size()),
                                  static_cast<FT_Int>(ends.size()), &ft);
    if (err) {
        return Err(std::string("rasterize: FT_Outline_New failed: ") + font::ftErrorString(err));
    }

    const auto height = static_cast<float>(canvas.height());
    // Baseline measured from the bottom edge, y up
    const float baselineUp = height - placement.baseline;

    using TagType = std::remove_pointer_t<decltype(ft.tags)>;
    for (size_t i = 0; i < points.size(); ++i) {
        ft.points[i].x = toF26Dot6(placement.x + points[i].x * placement.scale);
        ft.points[i].y = toF26Dot6(baselineUp + points[i].y * placement.scale);
        ft.tags[i] = static_cast<TagType>(tags[i] & 3);
    }
    using ContourIndex = std::remove_pointer_t<decltype(ft.contours)>;
    for (size_t i = 0; i < ends.size(); ++i) {
        ft.contours[i] = static_cast<ContourIndex>(ends[i]);
    }
    ft.flags = FT_OUTLINE_NONE;

    SpanContext ctx{&canvas, static_cast<int>(canvas.height())};

    FT_Raster_Params params{};
    params.flags = FT_RASTER_FLAG_AA | FT_RASTER_FLAG_DIRECT | FT_RASTER_FLAG_CLIP;
    params.gray_spans = blendSpans;
    params.user = &ctx;
    params.clip_box.xMin = 0;
    params.clip_box.yMin = 0;
    params.clip_box.xMax = static_cast<FT_Pos>(canvas.width());
    params.clip_box.yMax = static_cast<FT_Pos>(canvas.height());

    err = FT_Outline_Render(lib, &ft, &params);
    FT_Outline_Done(lib, &ft);
    if (err) {
        return Err(std::string("rasterize: FT_Outline_Render failed: ") + font::ftErrorString(err));
    }
    return Ok();
}

} // namespace fontdiff
