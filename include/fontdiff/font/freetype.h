#pragma once

typedef struct FT_LibraryRec_* FT_Library;

namespace fontdiff::font {

/**
 * FreeType library for the calling thread, created on first use.
 * FT_Library is not thread-safe, so every thread gets its own instance.
 * Returns nullptr when FreeType fails to initialize; the error is logged
 * once per thread.
 */
FT_Library ftLibrary();

// "invalid argument", "unknown file format", ...; never null
const char* ftErrorString(int error);

} // namespace fontdiff::font
