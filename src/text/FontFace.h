#pragma once

#include "render/RenderSpec.h"
#include "text/FontAxisController.h"
#include "util/Error.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include <hb.h>

#include <memory>
#include <string>

// Hinting is off for both layout paths and the rasterizer so advances agree
// between HarfBuzz and plain FreeType. Embedded bitmap strikes are skipped:
// the rasterizer only handles 8-bit grey coverage from outlines.
constexpr FT_Int32 kGlyphLoadFlags = FT_LOAD_DEFAULT | FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP;

// One font file at one pixel size and one set of axis values.
class FontFace {
public:
    FontFace(FT_Face face, hb_font_t* hb_font, std::string path, int size_px);
    ~FontFace();

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    FT_Face Face() const { return face_; }
    hb_font_t* HbFont() const { return hb_font_; }
    const std::string& Path() const { return path_; }
    int SizePx() const { return size_px_; }

    int AscenderPx() const;
    int DescenderPx() const; // negative below the baseline

private:
    FT_Face face_;
    hb_font_t* hb_font_;
    std::string path_;
    int size_px_;
};

// Owns the FreeType library and the per-file axis tables.
class FontLibrary {
public:
    FontLibrary();
    ~FontLibrary();

    FontLibrary(const FontLibrary&) = delete;
    FontLibrary& operator=(const FontLibrary&) = delete;

    bool IsReady() const { return library_ != nullptr; }
    FontAxisController& Axes() { return *axes_; }

    std::unique_ptr<FontFace> Open(const TextRoleStyle& style, Error* error);

private:
    FT_Library library_ = nullptr;
    std::unique_ptr<FontAxisController> axes_;
};
