#pragma once

#include <fontdiff/outline.h>
#include <fontdiff/result.hpp>
#include <fontdiff/shaper.h>
#include <fontdiff/value.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace fontdiff {

// Vertical metrics in font units
struct FontMetrics {
    double unitsPerEm = 1000.0;
    double ascender = 800.0;
    double descender = -200.0;
};

// Horizontal metrics and outline of one glyph, in font units
struct GlyphRecord {
    double advance = 0.0;
    double leftSideBearing = 0.0;
    std::optional<Outline> outline;  // nullopt for glyphs without contours
};

struct AxisInfo {
    std::string tag;
    std::string name;
    double minimum = 0.0;
    double defaultValue = 0.0;
    double maximum = 0.0;
};

struct AxisSetting {
    std::string tag;
    double value = 0.0;
};

// Position in design space, in user coordinates
using Location = std::vector<AxisSetting>;

struct NamedInstance {
    std::string name;
    Location location;
};

/**
 * FontSource - everything the diff engines need from a decoded font.
 *
 * Implementations wrap a font binary (FreeType in font::FtFont) or
 * synthesize data (test fakes). A source is configured once with
 * setLocation() and is read-only for the rest of the run.
 */
class FontSource {
public:
    using Ptr = std::shared_ptr<FontSource>;

    virtual ~FontSource() = default;

    // Family name, "Unknown" when the font has none
    virtual const std::string& name() const = 0;

    // Table tags from the table directory
    virtual std::vector<std::string> tableNames() const = 0;

    // Decode one table into a value tree. Err when the table is unreadable.
    virtual Result<Value> decodeTable(const std::string& tag) const = 0;

    // Whole-font tree: tag -> decoded table, failures as {"error": msg}
    Value decodeTables() const;

    virtual const std::set<uint32_t>& codepoints() const = 0;

    // Unicode script names (e.g. "Latin") of all supported codepoints
    std::set<std::string> supportedScripts() const;

    virtual std::vector<AxisInfo> axes() const = 0;
    virtual std::vector<NamedInstance> namedInstances() const = 0;

    virtual Result<void> setLocation(const Location& location) = 0;
    virtual const Location& location() const = 0;

    virtual FontMetrics metrics() const = 0;

    virtual Result<GlyphRecord> loadGlyph(uint32_t glyphId) const = 0;

    // Shaper bound to this font and its current location
    virtual Result<Shaper::Ptr> createShaper() const = 0;
};

} // namespace fontdiff
