#pragma once

#include "forecast/CityForecastSet.h"
#include "model/WeatherCodeMapping.h"
#include "render/GradientSynthesizer.h"
#include "render/IconCompositor.h"
#include "render/LayoutEngine.h"
#include "render/RenderSpec.h"
#include "render/RenderedImage.h"
#include "render/SurfaceUtil.h"
#include "text/FontFace.h"
#include "text/TextShaper.h"
#include "util/Error.h"

#include <SDL.h>

#include <cstdint>
#include <memory>
#include <string>

// Paints the forecast card: gradient, header band with logo and date, then
// one row per city (separator, icon, temperature, name). Any asset failure
// aborts the whole card.
class ImageAssembler {
public:
    ImageAssembler(RenderSpec spec,
                   WeatherCodeMapping mapping,
                   const TextShapingStrategy& shaper,
                   FontLibrary* fonts);

    // Canvas only, before encoding.
    bool Compose(const CityForecastSet& set, uint32_t gradient_seed, SurfacePtr* canvas, Error* error);

    bool Render(const CityForecastSet& set, uint32_t gradient_seed, RenderedImage* out, Error* error);

    const RenderSpec& Spec() const { return spec_; }

private:
    bool OpenAssets(Error* error);
    bool DrawHeader(SDL_Surface* canvas, const CardLayout& layout, const std::string& date, Error* error);
    bool DrawRow(SDL_Surface* canvas, const RowLayout& row, const ForecastRecord& record, Error* error);

    RenderSpec spec_;
    GradientSynthesizer gradients_;
    IconCompositor icons_;
    const TextShapingStrategy& shaper_;
    FontLibrary* fonts_;

    std::unique_ptr<FontFace> city_font_;
    std::unique_ptr<FontFace> temp_font_;
    std::unique_ptr<FontFace> date_font_;
    SurfacePtr logo_;
};

bool RenderForecastCard(const CityForecastSet& set,
                        const RenderSpec& spec,
                        const WeatherCodeMapping& mapping,
                        const TextShapingStrategy& shaper,
                        uint32_t gradient_seed,
                        RenderedImage* out,
                        Error* error);
