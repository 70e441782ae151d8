#pragma once

#include <fontdiff/font-source.h>
#include <fontdiff/result.hpp>
#include <fontdiff/shaper.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace fontdiff::font {

/**
 * HbShaper - HarfBuzz shaping over a font binary.
 *
 * The HarfBuzz font is scaled to units-per-em, so every offset and advance
 * comes back in font units. The bytes are shared, not copied, and stay
 * alive as long as the shaper does.
 */
class HbShaper : public Shaper {
public:
    static Result<Shaper::Ptr> create(std::shared_ptr<const std::vector<uint8_t>> data,
                                      const Location& location);

    ~HbShaper() override = default;

protected:
    HbShaper() = default;
};

} // namespace fontdiff::font
