#include "render/RenderSpec.h"

#include <nlohmann/json.hpp>

#include <cctype>

namespace {

const char* kDefaultFontPath = "fonts/OpenSans-Variable.ttf";

TextRoleStyle MakeRole(int size_px, double weight, double width, SDL_Color color) {
    TextRoleStyle role;
    role.font_path = kDefaultFontPath;
    role.size_px = size_px;
    role.axes = { { "weight", weight }, { "width", width } };
    role.color = color;
    return role;
}

int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

bool ParseHexByte(const std::string& text, size_t pos, Uint8* out) {
    int hi = HexDigit(text[pos]);
    int lo = HexDigit(text[pos + 1]);
    if (hi < 0 || lo < 0) {
        return false;
    }
    *out = static_cast<Uint8>(hi * 16 + lo);
    return true;
}

bool LoadRole(const nlohmann::json& j, const char* key, TextRoleStyle* role, Error* error) {
    if (!j.contains(key)) {
        return true;
    }
    const auto& item = j[key];
    if (!item.is_object()) {
        return SetError(error, ErrorCode::InvalidInput, std::string("render.") + key + " must be an object");
    }
    role->font_path = item.value("font_path", role->font_path);
    role->size_px = item.value("size_px", role->size_px);
    if (item.contains("color") && !ParseColor(item["color"], &role->color)) {
        return SetError(error, ErrorCode::InvalidInput, std::string("render.") + key + ".color is not a colour");
    }
    if (item.contains("axes")) {
        const auto& axes = item["axes"];
        if (!axes.is_object()) {
            return SetError(error, ErrorCode::InvalidInput, std::string("render.") + key + ".axes must be an object");
        }
        role->axes.clear();
        for (auto it = axes.begin(); it != axes.end(); ++it) {
            if (!it.value().is_number()) {
                return SetError(error, ErrorCode::InvalidInput,
                                std::string("render.") + key + ".axes." + it.key() + " must be a number");
            }
            role->axes.push_back({ it.key(), it.value().get<double>() });
        }
    }
    return true;
}

} // namespace

std::vector<GradientPalette> DefaultGradientPalettes() {
    return {
        { "sky", { { 135, 206, 250, 255 }, { 255, 255, 255, 255 } } },
        { "sunrise", { { 255, 183, 94, 255 }, { 255, 220, 180, 255 }, { 255, 247, 235, 255 } } },
        { "sea", { { 72, 166, 214, 255 }, { 158, 222, 230, 255 } } },
        { "dusk", { { 116, 106, 196, 255 }, { 221, 160, 221, 255 }, { 255, 228, 225, 255 } } },
        { "mint", { { 112, 204, 178, 255 }, { 224, 247, 238, 255 } } },
        { "sand", { { 230, 190, 138, 255 }, { 250, 240, 222, 255 } } },
    };
}

RenderSpec DefaultRenderSpec() {
    RenderSpec spec;
    spec.city_font = MakeRole(40, 600, 100, { 0, 0, 0, 255 });
    spec.temp_font = MakeRole(35, 500, 100, { 100, 100, 100, 255 });
    spec.date_font = MakeRole(50, 400, 100, { 0, 0, 0, 255 });
    spec.gradient_palettes = DefaultGradientPalettes();
    return spec;
}

bool ParseColor(const nlohmann::json& value, SDL_Color* out) {
    if (value.is_array()) {
        if (value.size() != 3 && value.size() != 4) {
            return false;
        }
        Uint8 channels[4] = { 0, 0, 0, 255 };
        for (size_t i = 0; i < value.size(); ++i) {
            if (!value[i].is_number_integer()) {
                return false;
            }
            int c = value[i].get<int>();
            if (c < 0 || c > 255) {
                return false;
            }
            channels[i] = static_cast<Uint8>(c);
        }
        *out = { channels[0], channels[1], channels[2], channels[3] };
        return true;
    }
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        if (text.empty() || text[0] != '#' || (text.size() != 7 && text.size() != 9)) {
            return false;
        }
        SDL_Color color{ 0, 0, 0, 255 };
        if (!ParseHexByte(text, 1, &color.r) || !ParseHexByte(text, 3, &color.g) || !ParseHexByte(text, 5, &color.b)) {
            return false;
        }
        if (text.size() == 9 && !ParseHexByte(text, 7, &color.a)) {
            return false;
        }
        *out = color;
        return true;
    }
    return false;
}

bool LoadRenderSpec(const nlohmann::json& j, RenderSpec* out, Error* error) {
    RenderSpec spec = DefaultRenderSpec();
    if (!j.is_object()) {
        return SetError(error, ErrorCode::InvalidInput, "render spec must be a JSON object");
    }

    try {
        spec.canvas_width = j.value("canvas_width", spec.canvas_width);
        spec.canvas_height = j.value("canvas_height", spec.canvas_height);
        spec.header_height = j.value("header_height", spec.header_height);
        spec.row_height = j.value("row_height", spec.row_height);
        spec.max_rows = j.value("max_rows", spec.max_rows);
        spec.padding_left = j.value("padding_left", spec.padding_left);
        spec.padding_right = j.value("padding_right", spec.padding_right);
        spec.element_spacing = j.value("element_spacing", spec.element_spacing);
        spec.name_column_width = j.value("name_column_width", spec.name_column_width);
        spec.icon_size = j.value("icon_size", spec.icon_size);
        spec.logo_height = j.value("logo_height", spec.logo_height);
        spec.logo_margin_top = j.value("logo_margin_top", spec.logo_margin_top);
        spec.separator_thickness = j.value("separator_thickness", spec.separator_thickness);
        spec.icon_dir = j.value("icon_dir", spec.icon_dir);
        spec.logo_path = j.value("logo_path", spec.logo_path);
        spec.jpeg_quality = j.value("jpeg_quality", spec.jpeg_quality);
    } catch (const nlohmann::json::exception& ex) {
        return SetError(error, ErrorCode::InvalidInput, std::string("render spec: ") + ex.what());
    }

    // A shared font_path applies to every role that does not set its own.
    if (j.contains("font_path") && j["font_path"].is_string()) {
        std::string path = j["font_path"].get<std::string>();
        spec.city_font.font_path = path;
        spec.temp_font.font_path = path;
        spec.date_font.font_path = path;
    }

    try {
        if (!LoadRole(j, "city_font", &spec.city_font, error) ||
            !LoadRole(j, "temp_font", &spec.temp_font, error) ||
            !LoadRole(j, "date_font", &spec.date_font, error)) {
            return false;
        }
    } catch (const nlohmann::json::exception& ex) {
        return SetError(error, ErrorCode::InvalidInput, std::string("render spec fonts: ") + ex.what());
    }

    if (j.contains("header_color") && !ParseColor(j["header_color"], &spec.header_color)) {
        return SetError(error, ErrorCode::InvalidInput, "render.header_color is not a colour");
    }
    if (j.contains("separator_color") && !ParseColor(j["separator_color"], &spec.separator_color)) {
        return SetError(error, ErrorCode::InvalidInput, "render.separator_color is not a colour");
    }

    if (j.contains("gradients")) {
        const auto& gradients = j["gradients"];
        if (!gradients.is_array()) {
            return SetError(error, ErrorCode::InvalidInput, "render.gradients must be an array");
        }
        spec.gradient_palettes.clear();
        for (const auto& item : gradients) {
            GradientPalette palette;
            if (!item.is_object() || !item.contains("stops") || !item["stops"].is_array()) {
                return SetError(error, ErrorCode::InvalidInput, "render.gradients entries need a 'stops' array");
            }
            palette.name = "palette" + std::to_string(spec.gradient_palettes.size());
            if (item.contains("name")) {
                if (!item["name"].is_string()) {
                    return SetError(error, ErrorCode::InvalidInput, "render.gradients." + palette.name +
                                                                        " name must be a string");
                }
                palette.name = item["name"].get<std::string>();
            }
            for (const auto& stop : item["stops"]) {
                SDL_Color color;
                if (!ParseColor(stop, &color)) {
                    return SetError(error, ErrorCode::InvalidInput, "render.gradients." + palette.name + " has a bad colour");
                }
                palette.stops.push_back(color);
            }
            spec.gradient_palettes.push_back(std::move(palette));
        }
    }

    if (!ValidateRenderSpec(spec, error)) {
        return false;
    }
    *out = std::move(spec);
    return true;
}

bool ValidateRenderSpec(const RenderSpec& spec, Error* error) {
    if (spec.canvas_width <= 0 || spec.canvas_height <= 0) {
        return SetError(error, ErrorCode::InvalidInput, "canvas size must be positive");
    }
    if (spec.header_height < 0 || spec.header_height >= spec.canvas_height) {
        return SetError(error, ErrorCode::InvalidInput, "header height must fit inside the canvas");
    }
    if (spec.row_height <= 0 || spec.max_rows <= 0) {
        return SetError(error, ErrorCode::InvalidInput, "row height and max rows must be positive");
    }
    if (spec.padding_left < 0 || spec.padding_right < 0 ||
        spec.padding_left + spec.padding_right >= spec.canvas_width) {
        return SetError(error, ErrorCode::InvalidInput, "horizontal padding leaves no room for rows");
    }
    if (spec.icon_size <= 0 || spec.logo_height <= 0) {
        return SetError(error, ErrorCode::InvalidInput, "icon and logo sizes must be positive");
    }
    if (spec.city_font.size_px <= 0 || spec.temp_font.size_px <= 0 || spec.date_font.size_px <= 0) {
        return SetError(error, ErrorCode::InvalidInput, "font sizes must be positive");
    }
    if (spec.jpeg_quality < 1 || spec.jpeg_quality > 100) {
        return SetError(error, ErrorCode::InvalidInput, "jpeg quality must be within 1..100");
    }
    if (spec.gradient_palettes.empty()) {
        return SetError(error, ErrorCode::InvalidInput, "at least one gradient palette is required");
    }
    for (const auto& palette : spec.gradient_palettes) {
        if (palette.stops.size() < 2) {
            return SetError(error, ErrorCode::InvalidInput, "gradient '" + palette.name + "' needs two or more colours");
        }
    }
    return true;
}
