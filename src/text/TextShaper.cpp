#include "text/TextShaper.h"

#include <cstring>
#include <iostream>

namespace {

struct HbBufferDeleter {
    void operator()(hb_buffer_t* buffer) const {
        if (buffer) {
            hb_buffer_destroy(buffer);
        }
    }
};

using HbBufferPtr = std::unique_ptr<hb_buffer_t, HbBufferDeleter>;

// Matches the rounding HarfBuzz's FreeType backend applies to 16.16 advances.
long AdvanceTo26Dot6(FT_Fixed advance) {
    return static_cast<long>((advance + (1 << 9)) >> 10);
}

// Right-to-left runs keep nominal advances, as LayoutLeftToRight does.
const std::vector<hb_feature_t>& RightToLeftFeatures() {
    static const std::vector<hb_feature_t> features = [] {
        std::vector<hb_feature_t> parsed;
        for (const char* text : { "-kern", "-dist" }) {
            hb_feature_t feature{};
            if (hb_feature_from_string(text, -1, &feature)) {
                parsed.push_back(feature);
            }
        }
        return parsed;
    }();
    return features;
}

bool ShapeRun(const FontFace& font, const BidiRun& run, GlyphRun* out, Error* error) {
    HbBufferPtr buffer(hb_buffer_create());
    if (!hb_buffer_allocation_successful(buffer.get())) {
        return SetError(error, ErrorCode::EncodingFailure, "HarfBuzz buffer allocation failed");
    }
    hb_buffer_add_utf8(buffer.get(), run.text.c_str(), static_cast<int>(run.text.size()), 0,
                       static_cast<int>(run.text.size()));
    hb_buffer_set_direction(buffer.get(),
                            run.direction == TextDirection::RightToLeft ? HB_DIRECTION_RTL : HB_DIRECTION_LTR);
    hb_buffer_guess_segment_properties(buffer.get());
    if (run.direction == TextDirection::RightToLeft) {
        hb_shape(font.HbFont(), buffer.get(), RightToLeftFeatures().data(),
                 static_cast<unsigned int>(RightToLeftFeatures().size()));
    } else {
        hb_shape(font.HbFont(), buffer.get(), nullptr, 0);
    }

    unsigned int count = 0;
    const hb_glyph_info_t* infos = hb_buffer_get_glyph_infos(buffer.get(), &count);
    const hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer.get(), &count);
    for (unsigned int i = 0; i < count; ++i) {
        PositionedGlyph glyph;
        glyph.glyph_index = infos[i].codepoint;
        glyph.x_advance = positions[i].x_advance;
        glyph.x_offset = positions[i].x_offset;
        glyph.y_offset = positions[i].y_offset;
        out->advance_width += glyph.x_advance;
        out->glyphs.push_back(glyph);
    }
    return true;
}

} // namespace

bool NativeShapingStrategy::Shape(const FontFace& font,
                                  const std::string& text,
                                  TextDirection base,
                                  GlyphRun* out,
                                  Error* error) const {
    *out = GlyphRun{};
    std::vector<BidiRun> runs;
    if (!SplitVisualRuns(text, base, &runs, error)) {
        return false;
    }
    for (const auto& run : runs) {
        if (!ShapeRun(font, run, out, error)) {
            return false;
        }
    }
    return true;
}

bool PreShapedStrategy::Shape(const FontFace& font,
                              const std::string& text,
                              TextDirection base,
                              GlyphRun* out,
                              Error* error) const {
    *out = GlyphRun{};
    std::u32string visual;
    if (!ReorderToVisual(text, base, &visual, error)) {
        return false;
    }
    return LayoutLeftToRight(font, visual, out, error);
}

bool LayoutLeftToRight(const FontFace& font, const std::u32string& visual, GlyphRun* out, Error* error) {
    *out = GlyphRun{};
    FT_Face face = font.Face();
    for (char32_t cp : visual) {
        PositionedGlyph glyph;
        glyph.glyph_index = FT_Get_Char_Index(face, static_cast<FT_ULong>(cp));

        FT_Fixed advance = 0;
        FT_Error err = FT_Get_Advance(face, glyph.glyph_index, kGlyphLoadFlags, &advance);
        if (err != 0) {
            return SetError(error, ErrorCode::EncodingFailure,
                            "no advance for glyph " + std::to_string(glyph.glyph_index) + " in " + font.Path());
        }
        glyph.x_advance = AdvanceTo26Dot6(advance);
        out->advance_width += glyph.x_advance;
        out->glyphs.push_back(glyph);
    }
    return true;
}

bool ParseShapingMode(const std::string& text, ShapingMode* out) {
    if (text == "auto") {
        *out = ShapingMode::Auto;
    } else if (text == "native") {
        *out = ShapingMode::Native;
    } else if (text == "preshaped") {
        *out = ShapingMode::PreShaped;
    } else {
        return false;
    }
    return true;
}

bool ProbeNativeShaping() {
    const char** shapers = hb_shape_list_shapers();
    for (const char** it = shapers; it && *it; ++it) {
        if (std::strcmp(*it, "ot") == 0) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<TextShapingStrategy> CreateShapingStrategy(ShapingMode mode, Error* error) {
    bool native_available = ProbeNativeShaping();
    switch (mode) {
    case ShapingMode::Native:
        if (!native_available) {
            SetError(error, ErrorCode::InvalidInput, "native shaping requested but HarfBuzz has no OpenType shaper");
            return nullptr;
        }
        return std::make_unique<NativeShapingStrategy>();
    case ShapingMode::PreShaped:
        return std::make_unique<PreShapedStrategy>();
    case ShapingMode::Auto:
        break;
    }
    if (native_available) {
        return std::make_unique<NativeShapingStrategy>();
    }
    std::cout << "Text: OpenType shaper unavailable, using pre-shaped layout\n";
    return std::make_unique<PreShapedStrategy>();
}
