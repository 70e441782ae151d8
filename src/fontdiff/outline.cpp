#include <fontdiff/outline.h>

#include <algorithm>

namespace fontdiff {

void Outline::addContour(const std::vector<Point>& points, const std::vector<uint8_t>& tags) {
    if (points.empty() || points.size() != tags.size()) return;
    _points.insert(_points.end(), points.begin(), points.end());
    _tags.insert(_tags.end(), tags.begin(), tags.end());
    _contourEnds.push_back(static_cast<uint16_t>(_points.size() - 1));
}

void Outline::addPolygon(const std::vector<Point>& points) {
    addContour(points, std::vector<uint8_t>(points.size(), OnCurve));
}

Bounds Outline::bounds() const {
    if (_points.empty()) return {};
    Bounds b{_points[0].x, _points[0].y, _points[0].x, _points[0].y};
    for (const auto& p : _points) {
        b.xMin = std::min(b.xMin, p.x);
        b.yMin = std::min(b.yMin, p.y);
        b.xMax = std::max(b.xMax, p.x);
        b.yMax = std::max(b.yMax, p.y);
    }
    return b;
}

} // namespace fontdiff
