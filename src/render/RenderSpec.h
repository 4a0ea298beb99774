#pragma once

#include "util/Error.h"

#include <SDL.h>
#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

struct AxisSetting {
    std::string axis; // "weight", "width", ... or a four letter tag
    double value = 0.0;
};

struct TextRoleStyle {
    std::string font_path;
    int size_px = 40;
    std::vector<AxisSetting> axes;
    SDL_Color color{ 0, 0, 0, 255 };
};

struct GradientPalette {
    std::string name;
    std::vector<SDL_Color> stops; // top to bottom, at least two
};

// Everything the renderer needs to know about the look of the card. Built
// once from configuration and only read during a render.
struct RenderSpec {
    int canvas_width = 1080;
    int canvas_height = 1920;
    int header_height = 180;
    int row_height = 105;
    int max_rows = 20;
    int padding_left = 160;
    int padding_right = 160;
    int element_spacing = 40;
    int name_column_width = 300;
    int icon_size = 65;
    int logo_height = 120;
    int logo_margin_top = 30;
    int separator_thickness = 1;

    TextRoleStyle city_font;
    TextRoleStyle temp_font;
    TextRoleStyle date_font;

    SDL_Color header_color{ 255, 255, 255, 255 };
    SDL_Color separator_color{ 255, 255, 255, 50 };
    std::vector<GradientPalette> gradient_palettes;

    std::string icon_dir = "assets/weather_icons";
    std::string logo_path = "assets/logos/IMS_logo.png";
    int jpeg_quality = 95;
};

RenderSpec DefaultRenderSpec();
std::vector<GradientPalette> DefaultGradientPalettes();

// Keys missing from `j` keep the values of DefaultRenderSpec().
bool LoadRenderSpec(const nlohmann::json& j, RenderSpec* out, Error* error);
bool ValidateRenderSpec(const RenderSpec& spec, Error* error);

bool ParseColor(const nlohmann::json& value, SDL_Color* out);
