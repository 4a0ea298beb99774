#pragma once

#include "render/SurfaceUtil.h"
#include "text/TextShaper.h"
#include "util/Error.h"

#include <SDL.h>

#include <string>

// Draws a glyph run in one colour. The returned surface is cropped to the
// inked pixels, so its size is the text's visual bounding box.
SurfacePtr RasterizeRun(const FontFace& font, const GlyphRun& run, SDL_Color color, Error* error);

SurfacePtr RenderText(const TextShapingStrategy& strategy,
                      const FontFace& font,
                      const std::string& text,
                      TextDirection base,
                      SDL_Color color,
                      Error* error);
