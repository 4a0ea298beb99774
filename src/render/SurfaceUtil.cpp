#include "render/SurfaceUtil.h"

#include <iostream>

SurfacePtr CreateCanvasSurface(int width, int height) {
    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, width, height, 32, kCanvasPixelFormat);
    if (!surface) {
        std::cerr << "SDL_CreateRGBSurfaceWithFormat failed: " << SDL_GetError() << "\n";
        return nullptr;
    }
    return SurfacePtr(surface);
}

SurfacePtr ConvertToCanvasFormat(SDL_Surface* surface) {
    if (!surface) {
        return nullptr;
    }
    SDL_Surface* converted = SDL_ConvertSurfaceFormat(surface, kCanvasPixelFormat, 0);
    if (!converted) {
        std::cerr << "SDL_ConvertSurfaceFormat failed: " << SDL_GetError() << "\n";
        return nullptr;
    }
    return SurfacePtr(converted);
}

SurfacePtr ResizeSurface(SDL_Surface* source, int width, int height) {
    if (!source || width <= 0 || height <= 0) {
        return nullptr;
    }
    SurfacePtr current = ConvertToCanvasFormat(source);
    if (!current) {
        return nullptr;
    }

    while (current->w / 2 >= width && current->h / 2 >= height) {
        SurfacePtr half = CreateCanvasSurface(current->w / 2, current->h / 2);
        if (!half) {
            return nullptr;
        }
        if (SDL_SoftStretchLinear(current.get(), nullptr, half.get(), nullptr) != 0) {
            std::cerr << "SDL_SoftStretchLinear failed: " << SDL_GetError() << "\n";
            return nullptr;
        }
        current = std::move(half);
    }

    if (current->w == width && current->h == height) {
        return current;
    }
    SurfacePtr out = CreateCanvasSurface(width, height);
    if (!out) {
        return nullptr;
    }
    if (SDL_SoftStretchLinear(current.get(), nullptr, out.get(), nullptr) != 0) {
        std::cerr << "SDL_SoftStretchLinear failed: " << SDL_GetError() << "\n";
        return nullptr;
    }
    return out;
}

bool CompositeOver(SDL_Surface* src, SDL_Surface* dst, int x, int y) {
    if (!src || !dst) {
        return false;
    }
    if (SDL_SetSurfaceBlendMode(src, SDL_BLENDMODE_BLEND) != 0) {
        std::cerr << "SDL_SetSurfaceBlendMode failed: " << SDL_GetError() << "\n";
        return false;
    }
    SDL_Rect dst_rect{ x, y, src->w, src->h };
    if (SDL_BlitSurface(src, nullptr, dst, &dst_rect) != 0) {
        std::cerr << "SDL_BlitSurface failed: " << SDL_GetError() << "\n";
        return false;
    }
    return true;
}

bool FillRectBlended(SDL_Surface* dst, const SDL_Rect& rect, SDL_Color color) {
    if (!dst || rect.w <= 0 || rect.h <= 0) {
        return false;
    }
    if (color.a == 255) {
        Uint32 pixel = SDL_MapRGBA(dst->format, color.r, color.g, color.b, color.a);
        if (SDL_FillRect(dst, &rect, pixel) != 0) {
            std::cerr << "SDL_FillRect failed: " << SDL_GetError() << "\n";
            return false;
        }
        return true;
    }
    SurfacePtr overlay = CreateCanvasSurface(rect.w, rect.h);
    if (!overlay) {
        return false;
    }
    Uint32 pixel = SDL_MapRGBA(overlay->format, color.r, color.g, color.b, color.a);
    if (SDL_FillRect(overlay.get(), nullptr, pixel) != 0) {
        std::cerr << "SDL_FillRect failed: " << SDL_GetError() << "\n";
        return false;
    }
    return CompositeOver(overlay.get(), dst, rect.x, rect.y);
}

SDL_Color ReadPixel(SDL_Surface* surface, int x, int y) {
    SDL_Color color{ 0, 0, 0, 0 };
    if (!surface || x < 0 || y < 0 || x >= surface->w || y >= surface->h ||
        surface->format->BytesPerPixel != 4) {
        return color;
    }
    if (SDL_LockSurface(surface) != 0) {
        return color;
    }
    const Uint8* row = static_cast<const Uint8*>(surface->pixels) + y * surface->pitch;
    Uint32 pixel = reinterpret_cast<const Uint32*>(row)[x];
    SDL_UnlockSurface(surface);
    SDL_GetRGBA(pixel, surface->format, &color.r, &color.g, &color.b, &color.a);
    return color;
}

std::string JoinPath(const std::string& dir, const std::string& file) {
    if (dir.empty()) {
        return file;
    }
    char last = dir.back();
    if (last == '/' || last == '\\') {
        return dir + file;
    }
    return dir + "/" + file;
}
