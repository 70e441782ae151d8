#pragma once

#include <fontdiff/font-source.h>
#include <fontdiff/result.hpp>

#include <string>

namespace fontdiff {

// "wght=400,wdth=75" -> [{wght, 400}, {wdth, 75}]
Result<Location> parseLocation(const std::string& spec);

std::string formatLocation(const Location& location);

// Location of the named instance called `name`
Result<Location> resolveInstance(const FontSource& font, const std::string& name);

/**
 * Put both fonts at the same place in design space before diffing.
 * At most one of locationSpec and instanceName may be non-empty; an
 * instance must exist in both fonts. Any failure is fatal to the run.
 */
Result<void> applyLocation(FontSource& fontA, FontSource& fontB,
                           const std::string& locationSpec,
                           const std::string& instanceName);

} // namespace fontdiff
