#include "TestSupport.h"

#include "forecast/CityForecastSet.h"
#include "model/WeatherCodeMapping.h"
#include "render/GradientSynthesizer.h"
#include "render/IconCompositor.h"
#include "render/ImageAssembler.h"
#include "render/LayoutEngine.h"
#include "render/RenderSpec.h"
#include "render/RenderedImage.h"
#include "render/SurfaceUtil.h"
#include "text/FontFace.h"
#include "text/TextShaper.h"
#include "util/Error.h"

#include <SDL.h>
#include <SDL_image.h>
#include <nlohmann/json.hpp>

#include <fstream>
#include <iterator>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool SameColor(const SDL_Color& a, const SDL_Color& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

// Left half transparent, right half opaque red.
bool WriteHalfIcon(const fs::path& path, int size) {
    SurfacePtr icon = CreateCanvasSurface(size, size);
    if (!icon) {
        return false;
    }
    SDL_FillRect(icon.get(), nullptr, SDL_MapRGBA(icon->format, 0, 0, 0, 0));
    SDL_Rect right{ size / 2, 0, size - size / 2, size };
    SDL_FillRect(icon.get(), &right, SDL_MapRGBA(icon->format, 255, 0, 0, 255));
    return IMG_SavePNG(icon.get(), path.string().c_str()) == 0;
}

bool WriteSolidIcon(const fs::path& path, int size, SDL_Color color) {
    SurfacePtr icon = CreateCanvasSurface(size, size);
    if (!icon) {
        return false;
    }
    SDL_FillRect(icon.get(), nullptr, SDL_MapRGBA(icon->format, color.r, color.g, color.b, color.a));
    return IMG_SavePNG(icon.get(), path.string().c_str()) == 0;
}

} // namespace

static void TestLayoutInvariant() {
    RenderSpec spec = DefaultRenderSpec();
    for (int n = 1; n <= spec.max_rows; ++n) {
        CardLayout layout;
        Error error;
        ASSERT_TRUE(ComputeCardLayout(spec, n, &layout, &error));
        EXPECT_EQ(static_cast<int>(layout.rows.size()), n);
        EXPECT_EQ(spec.header_height + n * layout.row_height + layout.top_padding + layout.bottom_padding,
                  spec.canvas_height);
        EXPECT_TRUE(layout.bottom_padding - layout.top_padding >= 0);
        EXPECT_TRUE(layout.bottom_padding - layout.top_padding <= 1);
        EXPECT_FALSE(layout.rows.front().has_separator);
        for (int i = 1; i < n; ++i) {
            EXPECT_TRUE(layout.rows[i].has_separator);
            EXPECT_EQ(layout.rows[i].row.y, layout.rows[i - 1].row.y + layout.row_height);
        }
        EXPECT_EQ(layout.rows.back().row.y + layout.row_height + layout.bottom_padding, spec.canvas_height);
    }
}

static void TestLayoutColumns() {
    RenderSpec spec = DefaultRenderSpec();
    CardLayout layout;
    Error error;
    ASSERT_TRUE(ComputeCardLayout(spec, 15, &layout, &error));
    EXPECT_EQ(layout.row_height, 105);
    EXPECT_EQ(layout.top_padding, (1920 - 180 - 15 * 105) / 2);
    EXPECT_EQ(layout.header.logo_anchor.x, spec.padding_left);
    EXPECT_EQ(layout.header.date_right_x, spec.canvas_width - spec.padding_right);

    const RowLayout& row = layout.rows[0];
    EXPECT_EQ(row.icon_anchor.x, spec.padding_left);
    EXPECT_EQ(row.icon_anchor.y, row.center_y - spec.icon_size / 2);
    EXPECT_EQ(row.name_right_x, spec.canvas_width - spec.padding_right);
    EXPECT_EQ(row.temp_zone.x, spec.padding_left + spec.icon_size + spec.element_spacing);
    EXPECT_EQ(row.temp_zone.x + row.temp_zone.w,
              spec.canvas_width - spec.padding_right - spec.name_column_width - spec.element_spacing);

    EXPECT_EQ(CenteredLeft(SDL_Rect{ 100, 0, 200, 10 }, 50), 175);
    EXPECT_EQ(RightAlignedLeft(900, 120), 780);
    EXPECT_EQ(CenteredTop(500, 40), 480);
}

static void TestLayoutRejectsBadCounts() {
    RenderSpec spec = DefaultRenderSpec();
    CardLayout layout;
    Error zero;
    EXPECT_FALSE(ComputeCardLayout(spec, 0, &layout, &zero));
    EXPECT_TRUE(zero.code == ErrorCode::InvalidInput);
    Error too_many;
    EXPECT_FALSE(ComputeCardLayout(spec, spec.max_rows + 1, &layout, &too_many));
    EXPECT_TRUE(too_many.code == ErrorCode::InvalidInput);

    // Rows shrink when the configured height does not fit.
    spec.row_height = 200;
    Error error;
    ASSERT_TRUE(ComputeCardLayout(spec, 20, &layout, &error));
    EXPECT_EQ(layout.row_height, (1920 - 180) / 20);
}

static void TestRenderSpecFromJson() {
    nlohmann::json j = nlohmann::json::parse(R"({
        "font_path": "fonts/Shared.ttf",
        "row_height": 90,
        "city_font": { "size_px": 44, "color": "#102030", "axes": { "weight": 700, "opsz": 14 } },
        "separator_color": [255, 255, 255, 64],
        "gradients": [ { "name": "mono", "stops": ["#000000", "#FFFFFF"] } ]
    })");
    RenderSpec spec;
    Error error;
    ASSERT_TRUE(LoadRenderSpec(j, &spec, &error));
    EXPECT_EQ(spec.row_height, 90);
    EXPECT_EQ(spec.canvas_width, 1080);
    EXPECT_EQ(spec.city_font.font_path, std::string("fonts/Shared.ttf"));
    EXPECT_EQ(spec.date_font.font_path, std::string("fonts/Shared.ttf"));
    EXPECT_EQ(spec.city_font.size_px, 44);
    EXPECT_EQ(static_cast<int>(spec.city_font.color.g), 0x20);
    ASSERT_TRUE(spec.city_font.axes.size() == 2u);
    EXPECT_EQ(spec.city_font.axes[0].axis, std::string("opsz"));
    EXPECT_EQ(static_cast<int>(spec.separator_color.a), 64);
    ASSERT_TRUE(spec.gradient_palettes.size() == 1u);
    EXPECT_EQ(spec.gradient_palettes[0].name, std::string("mono"));

    SDL_Color color{};
    EXPECT_TRUE(ParseColor(nlohmann::json("#FFFFFF32"), &color));
    EXPECT_EQ(static_cast<int>(color.a), 0x32);
    EXPECT_FALSE(ParseColor(nlohmann::json("FFFFFF"), &color));
    EXPECT_FALSE(ParseColor(nlohmann::json("#GG0000"), &color));
    EXPECT_FALSE(ParseColor(nlohmann::json::array({ 1, 2 }), &color));

    Error bad;
    EXPECT_FALSE(LoadRenderSpec(nlohmann::json::parse(R"({ "header_color": "white" })"), &spec, &bad));
    EXPECT_TRUE(bad.code == ErrorCode::InvalidInput);
    Error one_stop;
    EXPECT_FALSE(LoadRenderSpec(nlohmann::json::parse(R"({ "gradients": [ { "stops": ["#000000"] } ] })"), &spec,
                                &one_stop));

    Error numeric_name;
    EXPECT_FALSE(LoadRenderSpec(
        nlohmann::json::parse(R"({ "gradients": [ { "name": 5, "stops": ["#000000", "#FFFFFF"] } ] })"), &spec,
        &numeric_name));
    EXPECT_TRUE(numeric_name.code == ErrorCode::InvalidInput);

    Error named;
    RenderSpec with_names;
    ASSERT_TRUE(LoadRenderSpec(
        nlohmann::json::parse(R"({ "gradients": [ { "name": "dusk", "stops": ["#000000", "#FFFFFF"] },
                                                   { "stops": [[0, 0, 0], [9, 9, 9]] } ] })"),
        &with_names, &named));
    ASSERT_TRUE(with_names.gradient_palettes.size() == 2u);
    EXPECT_EQ(with_names.gradient_palettes[0].name, std::string("dusk"));
    EXPECT_EQ(with_names.gradient_palettes[1].name, std::string("palette1"));
}

static void TestGradientDeterminism() {
    GradientSynthesizer gradients(DefaultGradientPalettes());
    EXPECT_EQ(gradients.PaletteCount(), DefaultGradientPalettes().size());
    EXPECT_EQ(gradients.SelectPalette(20251015u), gradients.SelectPalette(20251015u));

    bool varies = false;
    for (uint32_t seed = 1; seed < 64 && !varies; ++seed) {
        varies = gradients.SelectPalette(seed) != gradients.SelectPalette(0);
    }
    EXPECT_TRUE(varies);

    Error error;
    SurfacePtr a = gradients.Render(32, 64, 7u, &error);
    SurfacePtr b = gradients.Render(32, 64, 7u, &error);
    ASSERT_TRUE(a && b);
    for (int y = 0; y < 64; y += 9) {
        EXPECT_TRUE(SameColor(ReadPixel(a.get(), 5, y), ReadPixel(b.get(), 5, y)));
    }

    const GradientPalette& palette = gradients.Palette(gradients.SelectPalette(7u));
    EXPECT_TRUE(SameColor(ReadPixel(a.get(), 0, 0), palette.stops.front()));
    EXPECT_TRUE(SameColor(ReadPixel(a.get(), 31, 63), palette.stops.back()));

    // Fixed and per-date policies.
    EXPECT_EQ(ResolveGradientSeed(GradientSeedPolicy::PerDate, "2025-10-15", 5u), 20251015u);
    EXPECT_EQ(ResolveGradientSeed(GradientSeedPolicy::Fixed, "2025-10-15", 5u), 5u);
    GradientSeedPolicy policy = GradientSeedPolicy::Fixed;
    EXPECT_TRUE(ParseGradientSeedPolicy("per_date", &policy));
    EXPECT_TRUE(policy == GradientSeedPolicy::PerDate);
    EXPECT_FALSE(ParseGradientSeedPolicy("daily", &policy));
}

static void TestGradientColorAt() {
    GradientPalette palette{ "bw", { { 0, 0, 0, 255 }, { 200, 100, 50, 255 } } };
    EXPECT_TRUE(SameColor(GradientSynthesizer::ColorAt(palette, 0, 101), SDL_Color{ 0, 0, 0, 255 }));
    EXPECT_TRUE(SameColor(GradientSynthesizer::ColorAt(palette, 100, 101), SDL_Color{ 200, 100, 50, 255 }));
    SDL_Color mid = GradientSynthesizer::ColorAt(palette, 50, 101);
    EXPECT_EQ(static_cast<int>(mid.r), 100);
    EXPECT_EQ(static_cast<int>(mid.g), 50);
    EXPECT_EQ(static_cast<int>(mid.b), 25);

    GradientPalette three{ "three", { { 0, 0, 0, 255 }, { 100, 100, 100, 255 }, { 200, 200, 200, 255 } } };
    SDL_Color centre = GradientSynthesizer::ColorAt(three, 50, 101);
    EXPECT_EQ(static_cast<int>(centre.r), 100);
}

static void TestIconCompositing() {
    fs::path dir = MakeTempPath("forecast_icons");
    std::error_code ec;
    fs::create_directories(dir, ec);
    ASSERT_TRUE(!ec);
    ASSERT_TRUE(WriteHalfIcon(dir / "1250_clear.png", 8));
    ASSERT_TRUE(WriteSolidIcon(dir / "1220_partly_cloudy.png", 8, SDL_Color{ 0, 0, 255, 255 }));

    WeatherCodeMapping mapping;
    Error error;
    ASSERT_TRUE(WeatherCodeMapping::Create({ { 1220, "1220_partly_cloudy" } }, "1250_clear", &mapping, &error));
    IconCompositor icons(mapping, dir.string(), 8);
    EXPECT_EQ(icons.IconPath("1250_clear"), (dir / "1250_clear.png").string());
    EXPECT_TRUE(icons.Preload(&error));

    SurfacePtr canvas = CreateCanvasSurface(32, 32);
    ASSERT_TRUE(canvas);
    SDL_FillRect(canvas.get(), nullptr, SDL_MapRGBA(canvas->format, 10, 200, 30, 255));

    // Unmapped code draws the fallback icon.
    EXPECT_TRUE(icons.Composite(9999, canvas.get(), SDL_Point{ 4, 4 }, &error));
    EXPECT_TRUE(SameColor(ReadPixel(canvas.get(), 5, 6), SDL_Color{ 10, 200, 30, 255 }));
    EXPECT_TRUE(SameColor(ReadPixel(canvas.get(), 10, 6), SDL_Color{ 255, 0, 0, 255 }));
    EXPECT_TRUE(SameColor(ReadPixel(canvas.get(), 20, 20), SDL_Color{ 10, 200, 30, 255 }));

    EXPECT_TRUE(icons.Composite(1220, canvas.get(), SDL_Point{ 20, 20 }, &error));
    EXPECT_TRUE(SameColor(ReadPixel(canvas.get(), 21, 21), SDL_Color{ 0, 0, 255, 255 }));

    fs::remove_all(dir, ec);
}

static void TestIconMissingIsFatal() {
    WeatherCodeMapping mapping;
    Error error;
    ASSERT_TRUE(WeatherCodeMapping::Create({}, "1250_clear", &mapping, &error));
    IconCompositor icons(mapping, MakeTempPath("no_icons").string(), 8);
    SurfacePtr canvas = CreateCanvasSurface(16, 16);
    ASSERT_TRUE(canvas);
    Error missing;
    EXPECT_FALSE(icons.Composite(1250, canvas.get(), SDL_Point{ 0, 0 }, &missing));
    EXPECT_TRUE(missing.code == ErrorCode::AssetMissing);
}

static void TestSeparatorBlend() {
    SurfacePtr canvas = CreateCanvasSurface(10, 10);
    ASSERT_TRUE(canvas);
    SDL_FillRect(canvas.get(), nullptr, SDL_MapRGBA(canvas->format, 0, 0, 0, 255));
    EXPECT_TRUE(FillRectBlended(canvas.get(), SDL_Rect{ 0, 5, 10, 1 }, SDL_Color{ 255, 255, 255, 128 }));
    SDL_Color line = ReadPixel(canvas.get(), 3, 5);
    EXPECT_NEAR(line.r, 128, 2);
    EXPECT_TRUE(SameColor(ReadPixel(canvas.get(), 3, 4), SDL_Color{ 0, 0, 0, 255 }));
}

static void TestJpegEncoding() {
    SurfacePtr canvas = CreateCanvasSurface(64, 48);
    ASSERT_TRUE(canvas);
    SDL_FillRect(canvas.get(), nullptr, SDL_MapRGBA(canvas->format, 40, 120, 200, 255));

    RenderedImage image;
    image.width = canvas->w;
    image.height = canvas->h;
    Error error;
    ASSERT_TRUE(EncodeJpeg(canvas.get(), 95, &image.bytes, &error));
    ASSERT_TRUE(image.bytes.size() > 4u);
    EXPECT_EQ(static_cast<int>(image.bytes[0]), 0xFF);
    EXPECT_EQ(static_cast<int>(image.bytes[1]), 0xD8);

    fs::path out = MakeTempPath("forecast_card_out") / "card.jpg";
    ASSERT_TRUE(image.WriteToFile(out.string(), &error));
    std::ifstream file(out, std::ios::binary);
    std::vector<char> read((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(read.size(), image.bytes.size());

    SurfacePtr decoded(IMG_Load(out.string().c_str()));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->w, 64);
    EXPECT_EQ(decoded->h, 48);

    std::error_code ec;
    fs::remove_all(out.parent_path(), ec);

    RenderedImage empty;
    Error nothing;
    EXPECT_FALSE(empty.WriteToFile(out.string(), &nothing));
    EXPECT_TRUE(nothing.code == ErrorCode::EncodingFailure);
}

static void TestRenderWithoutFontProducesNothing() {
    RenderSpec spec = DefaultRenderSpec();
    spec.city_font.font_path = MakeTempPath("missing_font").string() + ".ttf";
    spec.temp_font.font_path = spec.city_font.font_path;
    spec.date_font.font_path = spec.city_font.font_path;

    ForecastRecord record;
    record.city_id = "haifa";
    record.name_eng = "Haifa";
    record.name_heb = "חיפה";
    record.latitude = 32.8;
    record.date = "2025-10-15";
    record.weather_code = 1250;
    CityForecastSet set = CityForecastSet::Build("2025-10-15", { record }, nullptr);

    WeatherCodeMapping mapping;
    Error error;
    ASSERT_TRUE(WeatherCodeMapping::Create({}, "1250_clear", &mapping, &error));
    PreShapedStrategy shaper;
    RenderedImage image;
    Error render_error;
    EXPECT_FALSE(RenderForecastCard(set, spec, mapping, shaper, 1u, &image, &render_error));
    EXPECT_TRUE(render_error.code == ErrorCode::AssetMissing);
    EXPECT_TRUE(image.Empty());

    CityForecastSet empty = CityForecastSet::Build("2025-10-15", {}, nullptr);
    Error no_rows;
    EXPECT_FALSE(RenderForecastCard(empty, spec, mapping, shaper, 1u, &image, &no_rows));
    EXPECT_TRUE(no_rows.code == ErrorCode::DataUnavailable);
}

// Linear stretching in ResizeSurface needs SDL 2.0.16.
static void TestLinkedSdlSupportsLinearStretch() {
    SDL_version linked;
    SDL_GetVersion(&linked);
    EXPECT_TRUE(SDL_VERSIONNUM(linked.major, linked.minor, linked.patch) >= SDL_VERSIONNUM(2, 0, 16));

    SurfacePtr source = CreateCanvasSurface(8, 8);
    ASSERT_TRUE(source != nullptr);
    SDL_FillRect(source.get(), nullptr, SDL_MapRGBA(source->format, 10, 20, 30, 255));
    SurfacePtr scaled = ResizeSurface(source.get(), 3, 5);
    ASSERT_TRUE(scaled != nullptr);
    EXPECT_EQ(scaled->w, 3);
    EXPECT_EQ(scaled->h, 5);
    SDL_Color center = ReadPixel(scaled.get(), 1, 2);
    EXPECT_NEAR(center.g, 20, 1);
}

int main() {
    if (SDL_Init(0) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }
    IMG_Init(IMG_INIT_PNG | IMG_INIT_JPG);

    TestLayoutInvariant();
    TestLayoutColumns();
    TestLayoutRejectsBadCounts();
    TestRenderSpecFromJson();
    TestGradientDeterminism();
    TestGradientColorAt();
    TestIconCompositing();
    TestIconMissingIsFatal();
    TestSeparatorBlend();
    TestJpegEncoding();
    TestRenderWithoutFontProducesNothing();
    TestLinkedSdlSupportsLinearStretch();

    IMG_Quit();
    SDL_Quit();
    return ReportResult("forecast_card_render_tests");
}
