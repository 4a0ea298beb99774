#pragma once

#include <SDL.h>

#include <memory>
#include <string>

struct SurfaceDeleter {
    void operator()(SDL_Surface* surface) const {
        if (surface) {
            SDL_FreeSurface(surface);
        }
    }
};

using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

// All canvases and working images share this format.
constexpr Uint32 kCanvasPixelFormat = SDL_PIXELFORMAT_ARGB8888;

SurfacePtr CreateCanvasSurface(int width, int height);
SurfacePtr ConvertToCanvasFormat(SDL_Surface* surface);

// Scales with repeated halving before the final bilinear pass so large
// sources shrink without aliasing.
SurfacePtr ResizeSurface(SDL_Surface* source, int width, int height);

// Alpha-over onto `dst` at (x, y); transparent source pixels leave `dst` as is.
bool CompositeOver(SDL_Surface* src, SDL_Surface* dst, int x, int y);

bool FillRectBlended(SDL_Surface* dst, const SDL_Rect& rect, SDL_Color color);

SDL_Color ReadPixel(SDL_Surface* surface, int x, int y);

std::string JoinPath(const std::string& dir, const std::string& file);
