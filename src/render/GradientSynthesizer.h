#pragma once

#include "render/RenderSpec.h"
#include "render/SurfaceUtil.h"
#include "util/Error.h"

#include <SDL.h>

#include <cstdint>
#include <string>
#include <vector>

enum class GradientSeedPolicy {
    PerDate, // same palette for every render of a calendar date
    Random,  // fresh seed per run
    Fixed    // seed supplied by the caller
};

bool ParseGradientSeedPolicy(const std::string& text, GradientSeedPolicy* out);
uint32_t ResolveGradientSeed(GradientSeedPolicy policy, const std::string& date_iso, uint32_t fixed_seed);

class GradientSynthesizer {
public:
    explicit GradientSynthesizer(std::vector<GradientPalette> palettes);

    size_t SelectPalette(uint32_t seed) const;
    const GradientPalette& Palette(size_t index) const { return palettes_[index]; }
    size_t PaletteCount() const { return palettes_.size(); }

    SurfacePtr Render(int width, int height, uint32_t seed, Error* error) const;

    // Colour of pixel row `y` on a `height` tall gradient.
    static SDL_Color ColorAt(const GradientPalette& palette, int y, int height);

private:
    std::vector<GradientPalette> palettes_;
};
