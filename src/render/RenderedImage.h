#pragma once

#include "util/Error.h"

#include <SDL.h>

#include <string>
#include <vector>

// The finished card: raster size plus the encoded JPEG bytes.
struct RenderedImage {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> bytes;

    bool Empty() const { return bytes.empty(); }
    bool WriteToFile(const std::string& path, Error* error) const;
};

bool EncodeJpeg(SDL_Surface* canvas, int quality, std::vector<unsigned char>* out, Error* error);
