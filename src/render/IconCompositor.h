#pragma once

#include "model/WeatherCodeMapping.h"
#include "render/SurfaceUtil.h"
#include "util/Error.h"

#include <SDL.h>

#include <string>
#include <unordered_map>

// Draws the weather icon for a code. Icons live at <icon_dir>/<id>.png and
// are decoded and scaled once per id.
class IconCompositor {
public:
    IconCompositor(WeatherCodeMapping mapping, std::string icon_dir, int icon_size);

    const std::string& ResolveIconId(int code) const;
    std::string IconPath(const std::string& icon_id) const;

    // Loads every icon the mapping can produce.
    bool Preload(Error* error);

    bool Composite(int code, SDL_Surface* canvas, const SDL_Point& anchor, Error* error);

private:
    SDL_Surface* LoadIcon(const std::string& icon_id, Error* error);

    WeatherCodeMapping mapping_;
    std::string icon_dir_;
    int icon_size_;
    std::unordered_map<std::string, SurfacePtr> icons_;
};
