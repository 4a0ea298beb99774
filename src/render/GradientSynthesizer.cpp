#include "render/GradientSynthesizer.h"

#include "util/TimeUtil.h"

#include <random>

bool ParseGradientSeedPolicy(const std::string& text, GradientSeedPolicy* out) {
    if (text == "per_date") {
        *out = GradientSeedPolicy::PerDate;
    } else if (text == "random") {
        *out = GradientSeedPolicy::Random;
    } else if (text == "fixed") {
        *out = GradientSeedPolicy::Fixed;
    } else {
        return false;
    }
    return true;
}

uint32_t ResolveGradientSeed(GradientSeedPolicy policy, const std::string& date_iso, uint32_t fixed_seed) {
    switch (policy) {
        case GradientSeedPolicy::PerDate:
            return TimeUtil::DateSeed(date_iso);
        case GradientSeedPolicy::Random: {
            std::random_device device;
            return device();
        }
        case GradientSeedPolicy::Fixed:
            return fixed_seed;
    }
    return fixed_seed;
}

GradientSynthesizer::GradientSynthesizer(std::vector<GradientPalette> palettes) : palettes_(std::move(palettes)) {
    if (palettes_.empty()) {
        palettes_ = DefaultGradientPalettes();
    }
}

size_t GradientSynthesizer::SelectPalette(uint32_t seed) const {
    // mt19937 output is fixed by the standard; distributions are not, so the
    // index is taken with a plain modulo to stay stable across toolchains.
    std::mt19937 rng(seed);
    return static_cast<size_t>(rng() % palettes_.size());
}

SDL_Color GradientSynthesizer::ColorAt(const GradientPalette& palette, int y, int height) {
    const auto& stops = palette.stops;
    if (stops.empty()) {
        return { 0, 0, 0, 255 };
    }
    if (stops.size() == 1 || height <= 1) {
        return stops.front();
    }
    double ratio = static_cast<double>(y) / static_cast<double>(height - 1);
    double scaled = ratio * static_cast<double>(stops.size() - 1);
    size_t segment = static_cast<size_t>(scaled);
    if (segment >= stops.size() - 1) {
        return stops.back();
    }
    double t = scaled - static_cast<double>(segment);
    const SDL_Color& a = stops[segment];
    const SDL_Color& b = stops[segment + 1];
    auto lerp = [t](Uint8 from, Uint8 to) {
        return static_cast<Uint8>(from + (static_cast<int>(to) - static_cast<int>(from)) * t);
    };
    return { lerp(a.r, b.r), lerp(a.g, b.g), lerp(a.b, b.b), 255 };
}

SurfacePtr GradientSynthesizer::Render(int width, int height, uint32_t seed, Error* error) const {
    SurfacePtr surface = CreateCanvasSurface(width, height);
    if (!surface) {
        SetError(error, ErrorCode::EncodingFailure, std::string("cannot allocate gradient canvas: ") + SDL_GetError());
        return nullptr;
    }
    const GradientPalette& palette = palettes_[SelectPalette(seed)];
    for (int y = 0; y < height; ++y) {
        SDL_Color color = ColorAt(palette, y, height);
        SDL_Rect line{ 0, y, width, 1 };
        Uint32 pixel = SDL_MapRGBA(surface->format, color.r, color.g, color.b, 255);
        if (SDL_FillRect(surface.get(), &line, pixel) != 0) {
            SetError(error, ErrorCode::EncodingFailure, std::string("gradient fill failed: ") + SDL_GetError());
            return nullptr;
        }
    }
    return surface;
}
