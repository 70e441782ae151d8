#include <fontdiff/font/freetype.h>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <ytrace/ytrace.hpp>

// FT_Error_String is empty unless FreeType was built with error strings,
// so keep our own table from fterrors.h
struct FtErrorEntry {
    int code;
    const char* message;
};

#undef FTERRORS_H_
#define FT_ERRORDEF(e, v, s) {v, s},
#define FT_ERROR_START_LIST {
#define FT_ERROR_END_LIST {0, nullptr}};

static const FtErrorEntry FT_ERROR_TABLE[] =
#include FT_ERRORS_H

namespace fontdiff::font {

namespace {

class LibraryHolder {
public:
    LibraryHolder() {
        if (FT_Error err = FT_Init_FreeType(&_library)) {
            _library = nullptr;
            ywarn("FreeType initialization failed: {}", ftErrorString(err));
        }
    }

    ~LibraryHolder() {
        if (_library) FT_Done_FreeType(_library);
    }

    LibraryHolder(const LibraryHolder&) = delete;
    LibraryHolder& operator=(const LibraryHolder&) = delete;

    FT_Library get() const { return _library; }

private:
    FT_Library _library = nullptr;
};

} // namespace

FT_Library ftLibrary() {
    thread_local LibraryHolder holder;
    return holder.get();
}

const char* ftErrorString(int error) {
    if (const char* msg = FT_Error_String(error)) {
        return msg;
    }
    for (const FtErrorEntry* e = FT_ERROR_TABLE; e->message; ++e) {
        if (e->code == error) return e->message;
    }
    return "unknown FreeType error";
}

} // namespace fontdiff::font
