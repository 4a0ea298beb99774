#include "text/TextRasterizer.h"

#include <algorithm>
#include <cstring>

namespace {

Uint32* PixelRow(SDL_Surface* surface, int y) {
    return reinterpret_cast<Uint32*>(static_cast<Uint8*>(surface->pixels) + y * surface->pitch);
}

struct InkBounds {
    int left = 0;
    int top = 0;
    int right = -1; // inclusive
    int bottom = -1;

    bool Empty() const { return right < left || bottom < top; }

    void Add(int x, int y) {
        if (Empty()) {
            left = right = x;
            top = bottom = y;
            return;
        }
        left = std::min(left, x);
        right = std::max(right, x);
        top = std::min(top, y);
        bottom = std::max(bottom, y);
    }
};

// Coverage is merged with max() so overlapping glyph edges do not darken.
void DrawCoverage(SDL_Surface* target, const FT_Bitmap& bitmap, int left, int top, SDL_Color color, InkBounds* ink) {
    for (unsigned int row = 0; row < bitmap.rows; ++row) {
        int y = top + static_cast<int>(row);
        if (y < 0 || y >= target->h) {
            continue;
        }
        const unsigned char* src = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
        Uint32* dst = PixelRow(target, y);
        for (unsigned int col = 0; col < bitmap.width; ++col) {
            int x = left + static_cast<int>(col);
            if (x < 0 || x >= target->w || src[col] == 0) {
                continue;
            }
            Uint8 alpha = static_cast<Uint8>((src[col] * color.a + 127) / 255);
            Uint8 existing = static_cast<Uint8>(dst[x] >> 24);
            if (alpha > existing) {
                dst[x] = SDL_MapRGBA(target->format, color.r, color.g, color.b, alpha);
            }
            ink->Add(x, y);
        }
    }
}

} // namespace

SurfacePtr RasterizeRun(const FontFace& font, const GlyphRun& run, SDL_Color color, Error* error) {
    int pad = font.SizePx();
    int width = static_cast<int>((run.advance_width + 63) >> 6) + pad * 2;
    int height = font.AscenderPx() - font.DescenderPx() + pad * 2;
    SurfacePtr scratch = CreateCanvasSurface(std::max(width, 1), std::max(height, 1));
    if (!scratch) {
        SetError(error, ErrorCode::EncodingFailure, std::string("text surface: ") + SDL_GetError());
        return nullptr;
    }

    FT_Face face = font.Face();
    int baseline = pad + font.AscenderPx();
    long pen = static_cast<long>(pad) * 64;
    InkBounds ink;
    for (const auto& glyph : run.glyphs) {
        FT_Error err = FT_Load_Glyph(face, glyph.glyph_index, kGlyphLoadFlags | FT_LOAD_RENDER);
        if (err != 0) {
            SetError(error, ErrorCode::EncodingFailure,
                     "cannot render glyph " + std::to_string(glyph.glyph_index) + " from " + font.Path());
            return nullptr;
        }
        FT_GlyphSlot slot = face->glyph;
        if (slot->bitmap.pixel_mode != FT_PIXEL_MODE_GRAY && slot->bitmap.rows > 0) {
            SetError(error, ErrorCode::EncodingFailure,
                     "glyph " + std::to_string(glyph.glyph_index) + " from " + font.Path() + " is not a grey bitmap");
            return nullptr;
        }
        int origin_x = static_cast<int>((pen + glyph.x_offset + 32) >> 6);
        int origin_y = baseline - static_cast<int>((glyph.y_offset + 32) >> 6);
        DrawCoverage(scratch.get(), slot->bitmap, origin_x + slot->bitmap_left, origin_y - slot->bitmap_top, color,
                     &ink);
        pen += glyph.x_advance;
    }

    if (ink.Empty()) {
        return CreateCanvasSurface(1, 1);
    }

    int ink_w = ink.right - ink.left + 1;
    int ink_h = ink.bottom - ink.top + 1;
    SurfacePtr cropped = CreateCanvasSurface(ink_w, ink_h);
    if (!cropped) {
        SetError(error, ErrorCode::EncodingFailure, std::string("text surface: ") + SDL_GetError());
        return nullptr;
    }
    for (int y = 0; y < ink_h; ++y) {
        std::memcpy(PixelRow(cropped.get(), y), PixelRow(scratch.get(), ink.top + y) + ink.left,
                    static_cast<size_t>(ink_w) * sizeof(Uint32));
    }
    return cropped;
}

SurfacePtr RenderText(const TextShapingStrategy& strategy,
                      const FontFace& font,
                      const std::string& text,
                      TextDirection base,
                      SDL_Color color,
                      Error* error) {
    GlyphRun run;
    if (!strategy.Shape(font, text, base, &run, error)) {
        return nullptr;
    }
    return RasterizeRun(font, run, color, error);
}
