#include <fontdiff/gray-image.h>

#include <algorithm>

namespace fontdiff {

void GrayImage::accumulate(int32_t x, int32_t y, uint8_t v) {
    if (x < 0 || y < 0) return;
    if (static_cast<uint32_t>(x) >= _width || static_cast<uint32_t>(y) >= _height) return;
    auto& px = _pixels[index(static_cast<uint32_t>(x), static_cast<uint32_t>(y))];
    px = static_cast<uint8_t>(std::min<int>(255, px + v));
}

size_t GrayImage::inkCount() const {
    return static_cast<size_t>(
        std::count_if(_pixels.begin(), _pixels.end(), [](uint8_t p) { return p != 0; }));
}

std::string GrayImage::toAscii() const {
    std::string out;
    out.reserve(static_cast<size_t>(_width + 1) * _height);
    for (uint32_t y = 0; y < _height; ++y) {
        for (uint32_t x = 0; x < _width; ++x) {
            out += at(x, y) ? '#' : '.';
        }
        out += '\n';
    }
    return out;
}

} // namespace fontdiff
