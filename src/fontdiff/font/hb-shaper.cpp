#include <fontdiff/font/hb-shaper.h>

#include <hb.h>

namespace fontdiff::font {

namespace {

struct BlobDeleter {
    void operator()(hb_blob_t* blob) const noexcept { hb_blob_destroy(blob); }
};
struct FaceDeleter {
    void operator()(hb_face_t* face) const noexcept { hb_face_destroy(face); }
};
struct FontDeleter {
    void operator()(hb_font_t* font) const noexcept { hb_font_destroy(font); }
};
struct BufferDeleter {
    void operator()(hb_buffer_t* buffer) const noexcept { hb_buffer_destroy(buffer); }
};

using BlobPtr = std::unique_ptr<hb_blob_t, BlobDeleter>;
using FacePtr = std::unique_ptr<hb_face_t, FaceDeleter>;
using FontPtr = std::unique_ptr<hb_font_t, FontDeleter>;
using BufferPtr = std::unique_ptr<hb_buffer_t, BufferDeleter>;

using SharedBytes = std::shared_ptr<const std::vector<uint8_t>>;

// The blob holds its own reference to the bytes
void releaseBytes(void* userData) {
    delete static_cast<SharedBytes*>(userData);
}

} // namespace

class HbShaperImpl : public HbShaper {
public:
    explicit HbShaperImpl(SharedBytes data) : _data(std::move(data)) {}

    Result<void> init(const Location& location) {
        if (!_data || _data->empty()) {
            return Err("HbShaper: no font data");
        }

        hb_blob_t* blob = hb_blob_create(reinterpret_cast<const char*>(_data->data()),
                                         static_cast<unsigned int>(_data->size()),
                                         HB_MEMORY_MODE_READONLY,
                                         new SharedBytes(_data), releaseBytes);
        BlobPtr blobRef(blob);

        _face.reset(hb_face_create(blob, 0));
        if (hb_face_get_glyph_count(_face.get()) == 0) {
            return Err("HbShaper: HarfBuzz could not load the face");
        }

        _font.reset(hb_font_create(_face.get()));
        int upem = static_cast<int>(hb_face_get_upem(_face.get()));
        hb_font_set_scale(_font.get(), upem, upem);

        if (!location.empty()) {
            std::vector<hb_variation_t> variations;
            variations.reserve(location.size());
            for (const auto& setting : location) {
                hb_variation_t v;
                v.tag = hb_tag_from_string(setting.tag.c_str(),
                                           static_cast<int>(setting.tag.size()));
                v.value = static_cast<float>(setting.value);
                variations.push_back(v);
            }
            hb_font_set_variations(_font.get(), variations.data(),
                                   static_cast<unsigned int>(variations.size()));
        }
        return Ok();
    }

    std::vector<GlyphPosition> shape(Direction direction,
                                     const std::string& scriptTag,
                                     const std::string& text) const override {
        BufferPtr buffer(hb_buffer_create());
        hb_buffer_add_utf8(buffer.get(), text.data(), static_cast<int>(text.size()), 0, -1);
        hb_buffer_set_direction(buffer.get(), direction == Direction::RightToLeft
                                                  ? HB_DIRECTION_RTL
                                                  : HB_DIRECTION_LTR);
        if (!scriptTag.empty()) {
            hb_buffer_set_script(buffer.get(),
                                 hb_script_from_string(scriptTag.c_str(),
                                                       static_cast<int>(scriptTag.size())));
        }
        hb_buffer_guess_segment_properties(buffer.get());

        hb_shape(_font.get(), buffer.get(), nullptr, 0);

        unsigned int count = 0;
        hb_glyph_info_t* infos = hb_buffer_get_glyph_infos(buffer.get(), &count);
        hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer.get(), &count);

        std::vector<GlyphPosition> out;
        out.reserve(count);
        for (unsigned int i = 0; i < count; ++i) {
            GlyphPosition g;
            g.glyphId = infos[i].codepoint;
            g.xOffset = positions[i].x_offset;
            g.yOffset = positions[i].y_offset;
            g.xAdvance = positions[i].x_advance;
            g.yAdvance = positions[i].y_advance;
            out.push_back(g);
        }
        return out;
    }

private:
    SharedBytes _data;
    FacePtr _face;
    FontPtr _font;
};

Result<Shaper::Ptr> HbShaper::create(SharedBytes data, const Location& location) {
    auto impl = std::make_shared<HbShaperImpl>(std::move(data));
    if (auto res = impl->init(location); !res) {
        return Err<Shaper::Ptr>("HbShaper creation failed", res);
    }
    return Ok(Shaper::Ptr(std::move(impl)));
}

} // namespace fontdiff::font
