#include "render/ImageAssembler.h"

#include "text/TextRasterizer.h"
#include "util/TimeUtil.h"

#include <SDL_image.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace {

SurfacePtr LoadLogo(const std::string& path, int height, Error* error) {
    SurfacePtr raw(IMG_Load(path.c_str()));
    if (!raw) {
        SetError(error, ErrorCode::AssetMissing, "logo " + path + ": " + IMG_GetError());
        return nullptr;
    }
    int width = static_cast<int>(std::lround(static_cast<double>(raw->w) * height / raw->h));
    SurfacePtr scaled = ResizeSurface(raw.get(), std::max(width, 1), height);
    if (!scaled) {
        SetError(error, ErrorCode::AssetMissing, "logo " + path + " could not be scaled");
        return nullptr;
    }
    return scaled;
}

} // namespace

ImageAssembler::ImageAssembler(RenderSpec spec,
                               WeatherCodeMapping mapping,
                               const TextShapingStrategy& shaper,
                               FontLibrary* fonts)
    : spec_(std::move(spec)),
      gradients_(spec_.gradient_palettes),
      icons_(std::move(mapping), spec_.icon_dir, spec_.icon_size),
      shaper_(shaper),
      fonts_(fonts) {}

bool ImageAssembler::OpenAssets(Error* error) {
    if (!fonts_ || !fonts_->IsReady()) {
        return SetError(error, ErrorCode::AssetMissing, "font library unavailable");
    }
    if (!city_font_) {
        city_font_ = fonts_->Open(spec_.city_font, error);
        if (!city_font_) {
            return false;
        }
    }
    if (!temp_font_) {
        temp_font_ = fonts_->Open(spec_.temp_font, error);
        if (!temp_font_) {
            return false;
        }
    }
    if (!date_font_) {
        date_font_ = fonts_->Open(spec_.date_font, error);
        if (!date_font_) {
            return false;
        }
    }
    if (!logo_) {
        logo_ = LoadLogo(spec_.logo_path, spec_.logo_height, error);
        if (!logo_) {
            return false;
        }
    }
    return true;
}

bool ImageAssembler::DrawHeader(SDL_Surface* canvas, const CardLayout& layout, const std::string& date, Error* error) {
    if (!FillRectBlended(canvas, layout.header.band, spec_.header_color)) {
        return SetError(error, ErrorCode::EncodingFailure, "header fill failed");
    }
    if (!CompositeOver(logo_.get(), canvas, layout.header.logo_anchor.x, layout.header.logo_anchor.y)) {
        return SetError(error, ErrorCode::EncodingFailure, "logo blit failed");
    }

    SurfacePtr text = RenderText(shaper_, *date_font_, TimeUtil::FormatDisplayDate(date), TextDirection::LeftToRight,
                                 spec_.date_font.color, error);
    if (!text) {
        return false;
    }
    int x = RightAlignedLeft(layout.header.date_right_x, text->w);
    int y = CenteredTop(layout.header.center_y, text->h);
    if (!CompositeOver(text.get(), canvas, x, y)) {
        return SetError(error, ErrorCode::EncodingFailure, "date blit failed");
    }
    return true;
}

bool ImageAssembler::DrawRow(SDL_Surface* canvas, const RowLayout& row, const ForecastRecord& record, Error* error) {
    if (row.has_separator && spec_.separator_thickness > 0) {
        SDL_Rect line{ row.row.x, row.separator_y, row.row.w, spec_.separator_thickness };
        if (!FillRectBlended(canvas, line, spec_.separator_color)) {
            return SetError(error, ErrorCode::EncodingFailure, "separator fill failed");
        }
    }

    if (!icons_.Composite(record.weather_code, canvas, row.icon_anchor, error)) {
        return false;
    }

    SurfacePtr temp = RenderText(shaper_, *temp_font_, FormatTemperatureRange(record), TextDirection::LeftToRight,
                                 spec_.temp_font.color, error);
    if (!temp) {
        return false;
    }
    if (!CompositeOver(temp.get(), canvas, CenteredLeft(row.temp_zone, temp->w), CenteredTop(row.center_y, temp->h))) {
        return SetError(error, ErrorCode::EncodingFailure, "temperature blit failed");
    }

    bool hebrew = !record.name_heb.empty();
    SurfacePtr name = RenderText(shaper_, *city_font_, hebrew ? record.name_heb : record.name_eng,
                                 hebrew ? TextDirection::RightToLeft : TextDirection::LeftToRight,
                                 spec_.city_font.color, error);
    if (!name) {
        return false;
    }
    if (!CompositeOver(name.get(), canvas, RightAlignedLeft(row.name_right_x, name->w),
                       CenteredTop(row.center_y, name->h))) {
        return SetError(error, ErrorCode::EncodingFailure, "city name blit failed");
    }
    return true;
}

bool ImageAssembler::Compose(const CityForecastSet& set, uint32_t gradient_seed, SurfacePtr* canvas, Error* error) {
    if (!ValidateRenderSpec(spec_, error)) {
        return false;
    }
    if (set.Empty()) {
        return SetError(error, ErrorCode::DataUnavailable, "no cities to draw for " + set.Date());
    }
    CardLayout layout;
    if (!ComputeCardLayout(spec_, static_cast<int>(set.Size()), &layout, error)) {
        return false;
    }
    if (!OpenAssets(error)) {
        return false;
    }

    SurfacePtr surface = gradients_.Render(spec_.canvas_width, spec_.canvas_height, gradient_seed, error);
    if (!surface) {
        return false;
    }
    if (!DrawHeader(surface.get(), layout, set.Date(), error)) {
        return false;
    }
    for (size_t i = 0; i < set.Size(); ++i) {
        if (!DrawRow(surface.get(), layout.rows[i], set.Records()[i], error)) {
            return false;
        }
    }
    *canvas = std::move(surface);
    return true;
}

bool ImageAssembler::Render(const CityForecastSet& set, uint32_t gradient_seed, RenderedImage* out, Error* error) {
    SurfacePtr canvas;
    if (!Compose(set, gradient_seed, &canvas, error)) {
        return false;
    }
    RenderedImage image;
    image.width = canvas->w;
    image.height = canvas->h;
    if (!EncodeJpeg(canvas.get(), spec_.jpeg_quality, &image.bytes, error)) {
        return false;
    }
    std::cout << "Card: " << set.Size() << " rows for " << set.Date() << " using " << shaper_.Name()
              << " shaping, " << image.bytes.size() << " bytes\n";
    *out = std::move(image);
    return true;
}

bool RenderForecastCard(const CityForecastSet& set,
                        const RenderSpec& spec,
                        const WeatherCodeMapping& mapping,
                        const TextShapingStrategy& shaper,
                        uint32_t gradient_seed,
                        RenderedImage* out,
                        Error* error) {
    FontLibrary fonts;
    ImageAssembler assembler(spec, mapping, shaper, &fonts);
    return assembler.Render(set, gradient_seed, out, error);
}
