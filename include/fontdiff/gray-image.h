#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fontdiff {

/**
 * GrayImage - 8-bit single channel bitmap, row-major, origin top-left.
 */
class GrayImage {
public:
    GrayImage() = default;
    GrayImage(uint32_t width, uint32_t height)
        : _width(width), _height(height),
          _pixels(static_cast<size_t>(width) * height, 0) {}

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }
    bool empty() const { return _pixels.empty(); }

    uint8_t at(uint32_t x, uint32_t y) const { return _pixels[index(x, y)]; }
    void set(uint32_t x, uint32_t y, uint8_t v) { _pixels[index(x, y)] = v; }

    // Saturating add, silently ignores out-of-bounds coordinates
    void accumulate(int32_t x, int32_t y, uint8_t v);

    const std::vector<uint8_t>& pixels() const { return _pixels; }

    // Number of non-zero pixels
    size_t inkCount() const;

    // Debug dump as rows of '.' and '#'
    std::string toAscii() const;

    bool operator==(const GrayImage& other) const {
        return _width == other._width && _height == other._height &&
               _pixels == other._pixels;
    }
    bool operator!=(const GrayImage& other) const { return !(*this == other); }

private:
    size_t index(uint32_t x, uint32_t y) const {
        return static_cast<size_t>(y) * _width + x;
    }

    uint32_t _width = 0;
    uint32_t _height = 0;
    std::vector<uint8_t> _pixels;
};

} // namespace fontdiff
