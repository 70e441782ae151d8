#pragma once

#include <cstdint>
#include <vector>

namespace fontdiff {

struct Point {
    float x = 0.0f;
    float y = 0.0f;
};

struct Bounds {
    float xMin = 0.0f;
    float yMin = 0.0f;
    float xMax = 0.0f;
    float yMax = 0.0f;
};

/**
 * Outline - vector path of one glyph in font units (y up).
 *
 * Stored the way FreeType and TrueType store contours: a flat point list,
 * one tag per point and the index of the last point of every contour.
 * Tags follow FT_CURVE_TAG: on-curve points, conic (quadratic) control
 * points and cubic control points.
 */
class Outline {
public:
    enum Tag : uint8_t {
        Conic = 0,
        OnCurve = 1,
        Cubic = 2,
    };

    // Append a closed contour. tags.size() must equal points.size().
    void addContour(const std::vector<Point>& points, const std::vector<uint8_t>& tags);

    // Append a closed polygon made of on-curve points only
    void addPolygon(const std::vector<Point>& points);

    const std::vector<Point>& points() const { return _points; }
    const std::vector<uint8_t>& tags() const { return _tags; }
    const std::vector<uint16_t>& contourEnds() const { return _contourEnds; }

    bool empty() const { return _contourEnds.empty(); }

    // Control box of all points
    Bounds bounds() const;

private:
    std::vector<Point> _points;
    std::vector<uint8_t> _tags;
    std::vector<uint16_t> _contourEnds;
};

} // namespace fontdiff
