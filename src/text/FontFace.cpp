#include "text/FontFace.h"

#include <hb-ft.h>

#include <iostream>
#include <utility>

FontFace::FontFace(FT_Face face, hb_font_t* hb_font, std::string path, int size_px)
    : face_(face), hb_font_(hb_font), path_(std::move(path)), size_px_(size_px) {}

FontFace::~FontFace() {
    // The HarfBuzz font holds its own reference on the face.
    if (hb_font_) {
        hb_font_destroy(hb_font_);
    }
    if (face_) {
        FT_Done_Face(face_);
    }
}

int FontFace::AscenderPx() const {
    return static_cast<int>((face_->size->metrics.ascender + 63) >> 6);
}

int FontFace::DescenderPx() const {
    return static_cast<int>(face_->size->metrics.descender >> 6);
}

FontLibrary::FontLibrary() {
    if (FT_Init_FreeType(&library_) != 0) {
        std::cerr << "Fonts: FreeType init failed\n";
        library_ = nullptr;
        return;
    }
    axes_ = std::make_unique<FontAxisController>(library_);
}

FontLibrary::~FontLibrary() {
    axes_.reset();
    if (library_) {
        FT_Done_FreeType(library_);
    }
}

std::unique_ptr<FontFace> FontLibrary::Open(const TextRoleStyle& style, Error* error) {
    if (!library_) {
        SetError(error, ErrorCode::AssetMissing, "FreeType is not initialised");
        return nullptr;
    }
    if (style.size_px <= 0) {
        SetError(error, ErrorCode::InvalidInput, "font size must be positive for " + style.font_path);
        return nullptr;
    }

    FT_Face face = nullptr;
    FT_Error err = FT_New_Face(library_, style.font_path.c_str(), 0, &face);
    if (err != 0 || !face) {
        SetError(error, ErrorCode::AssetMissing,
                 "font " + style.font_path + " (FreeType error " + std::to_string(err) + ")");
        return nullptr;
    }
    FT_Select_Charmap(face, FT_ENCODING_UNICODE);

    if (!axes_->Apply(style.font_path, face, style.axes, error)) {
        FT_Done_Face(face);
        return nullptr;
    }

    err = FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(style.size_px));
    if (err != 0) {
        FT_Done_Face(face);
        SetError(error, ErrorCode::AssetMissing,
                 "font " + style.font_path + " cannot be sized to " + std::to_string(style.size_px) + "px");
        return nullptr;
    }

    hb_font_t* hb_font = hb_ft_font_create_referenced(face);
    hb_ft_font_set_load_flags(hb_font, kGlyphLoadFlags);
    hb_ft_font_changed(hb_font);

    return std::make_unique<FontFace>(face, hb_font, style.font_path, style.size_px);
}
