#include "render/IconCompositor.h"

#include <SDL_image.h>

#include <iostream>
#include <utility>

IconCompositor::IconCompositor(WeatherCodeMapping mapping, std::string icon_dir, int icon_size)
    : mapping_(std::move(mapping)), icon_dir_(std::move(icon_dir)), icon_size_(icon_size) {}

const std::string& IconCompositor::ResolveIconId(int code) const {
    return mapping_.Resolve(code);
}

std::string IconCompositor::IconPath(const std::string& icon_id) const {
    return JoinPath(icon_dir_, icon_id + ".png");
}

bool IconCompositor::Preload(Error* error) {
    for (const auto& id : mapping_.AssetIds()) {
        if (!LoadIcon(id, error)) {
            return false;
        }
    }
    return true;
}

SDL_Surface* IconCompositor::LoadIcon(const std::string& icon_id, Error* error) {
    auto it = icons_.find(icon_id);
    if (it != icons_.end()) {
        return it->second.get();
    }

    std::string path = IconPath(icon_id);
    SurfacePtr raw(IMG_Load(path.c_str()));
    if (!raw) {
        SetError(error, ErrorCode::AssetMissing, "icon '" + icon_id + "' (" + path + "): " + IMG_GetError());
        return nullptr;
    }
    SurfacePtr scaled = ResizeSurface(raw.get(), icon_size_, icon_size_);
    if (!scaled) {
        SetError(error, ErrorCode::AssetMissing, "icon '" + icon_id + "' could not be scaled");
        return nullptr;
    }
    SDL_Surface* icon = scaled.get();
    icons_[icon_id] = std::move(scaled);
    return icon;
}

bool IconCompositor::Composite(int code, SDL_Surface* canvas, const SDL_Point& anchor, Error* error) {
    const std::string& icon_id = ResolveIconId(code);
    if (!mapping_.IsMapped(code)) {
        std::cout << "Icons: weather code " << code << " unmapped, using " << icon_id << "\n";
    }
    SDL_Surface* icon = LoadIcon(icon_id, error);
    if (!icon) {
        return false;
    }
    if (!CompositeOver(icon, canvas, anchor.x, anchor.y)) {
        return SetError(error, ErrorCode::EncodingFailure, "icon blit failed: " + std::string(SDL_GetError()));
    }
    return true;
}
