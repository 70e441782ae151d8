#pragma once

#include <fontdiff/font-source.h>
#include <fontdiff/result.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fontdiff::font {

/**
 * FtFont - FontSource backed by a FreeType face.
 *
 * Owns the font bytes for its whole lifetime; shapers created from it share
 * them. Glyph outlines are in font units: the face is sized so that one
 * pixel equals one unit and FreeType's 26.6 output is divided by 64.
 */
class FtFont : public FontSource {
public:
    using Ptr = std::shared_ptr<FtFont>;

    static Result<Ptr> create(std::vector<uint8_t> data, std::string label);
    static Result<Ptr> open(const std::filesystem::path& path);

    ~FtFont() override = default;

    // File name or other caller-supplied label, used in log messages
    virtual const std::string& label() const = 0;

    virtual const std::string& familyName() const = 0;
    virtual bool isVariable() const = 0;

    // True when the font carries colour glyph tables (COLR, SVG, CBDT, sbix)
    virtual bool isColor() const = 0;

protected:
    FtFont() = default;
};

} // namespace fontdiff::font
