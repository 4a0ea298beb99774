#include <SDL.h>
#include <SDL_image.h>

#include <nlohmann/json.hpp>

#include "forecast/CityForecastSet.h"
#include "forecast/ForecastDateResolver.h"
#include "ingest/ForecastXmlParser.h"
#include "model/WeatherCodeMapping.h"
#include "render/GradientSynthesizer.h"
#include "render/ImageAssembler.h"
#include "render/RenderSpec.h"
#include "services/ForecastDownloadService.h"
#include "text/FontFace.h"
#include "text/TextShaper.h"
#include "util/Error.h"
#include "util/TimeUtil.h"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

struct AppConfig {
    std::string xml_path = "data/isr_cities.xml";
    std::string weather_codes_path = "config/weather_codes.json";
    std::string output_path = "output/daily_forecast.jpg";
    size_t expected_city_count = 15;
    std::string shaping_mode = "auto";
    std::string gradient_seed_policy = "per_date";
    uint32_t gradient_seed = 0;
    bool download_enabled = true;
    DownloadConfig download;
    RenderSpec render = DefaultRenderSpec();
};

struct CliOptions {
    std::string config_path = "config/config.json";
    std::string date;
    std::string output_path;
    bool no_download = false;
    bool dry_run = false;
    bool has_seed = false;
    uint32_t seed = 0;
    bool strict = false;
};

bool LoadConfig(const std::string& path, AppConfig* out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Failed to open config: " << path << "\n";
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse config: " << ex.what() << "\n";
        return false;
    }

    try {
        out->xml_path = j.value("xml_path", out->xml_path);
        out->weather_codes_path = j.value("weather_codes_path", out->weather_codes_path);
        out->output_path = j.value("output_path", out->output_path);
        out->expected_city_count = j.value("expected_city_count", out->expected_city_count);
        out->shaping_mode = j.value("shaping_mode", out->shaping_mode);
        out->gradient_seed_policy = j.value("gradient_seed_policy", out->gradient_seed_policy);
        out->gradient_seed = j.value("gradient_seed", out->gradient_seed);

        if (j.contains("download") && j["download"].is_object()) {
            const auto& d = j["download"];
            out->download_enabled = d.value("enabled", out->download_enabled);
            out->download.url = d.value("url", out->download.url);
            out->download.archive_dir = d.value("archive_dir", out->download.archive_dir);
            out->download.timeout_sec = d.value("timeout_sec", out->download.timeout_sec);
            out->download.max_retries = d.value("max_retries", out->download.max_retries);
            out->download.retry_delay_sec = d.value("retry_delay_sec", out->download.retry_delay_sec);
            out->download.retention_days = d.value("retention_days", out->download.retention_days);
        }
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "Invalid config value: " << ex.what() << "\n";
        return false;
    }
    out->download.xml_path = out->xml_path;

    if (j.contains("render")) {
        Error error;
        if (!LoadRenderSpec(j["render"], &out->render, &error)) {
            std::cerr << "Invalid render config: " << FormatError(error) << "\n";
            return false;
        }
    }
    return true;
}

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [config.json] [--date YYYY-MM-DD] [--output PATH] [--no-download] [--dry-run] [--seed N] [--strict]\n";
}

bool ParseArgs(int argc, char** argv, CliOptions* out) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string* value) {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value\n";
                return false;
            }
            *value = argv[++i];
            return true;
        };

        if (arg == "--date") {
            if (!next(&out->date)) {
                return false;
            }
            if (!TimeUtil::IsValidDate(out->date)) {
                std::cerr << "Invalid --date '" << out->date << "', expected YYYY-MM-DD\n";
                return false;
            }
        } else if (arg == "--output") {
            if (!next(&out->output_path)) {
                return false;
            }
        } else if (arg == "--seed") {
            std::string value;
            if (!next(&value)) {
                return false;
            }
            char* end = nullptr;
            unsigned long seed = std::strtoul(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0') {
                std::cerr << "Invalid --seed '" << value << "'\n";
                return false;
            }
            out->has_seed = true;
            out->seed = static_cast<uint32_t>(seed);
        } else if (arg == "--no-download") {
            out->no_download = true;
        } else if (arg == "--dry-run") {
            out->dry_run = true;
        } else if (arg == "--strict") {
            out->strict = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option " << arg << "\n";
            return false;
        } else {
            out->config_path = arg;
        }
    }
    return true;
}

bool LoadFeed(const AppConfig& config, const ForecastDownloadService& downloads, ParsedFeed* feed) {
    ForecastXmlParser parser;
    Error error;
    if (parser.ParseFile(config.xml_path, feed, &error)) {
        return true;
    }
    std::cerr << "Feed: " << FormatError(error) << "\n";

    std::string archive = downloads.NewestArchive();
    if (archive.empty()) {
        std::cerr << "Feed: no archive copy to fall back to\n";
        return false;
    }
    std::cout << "Feed: falling back to " << archive << "\n";
    error = Error{};
    if (!parser.ParseFile(archive, feed, &error)) {
        std::cerr << "Feed: " << FormatError(error) << "\n";
        return false;
    }
    return true;
}

void PrintCityTable(const CityForecastSet& set) {
    std::cout << "Cities for " << set.Date() << " (north to south):\n";
    int index = 1;
    for (const auto& record : set.Records()) {
        std::cout << "  " << std::setw(2) << index++ << ". " << std::left << std::setw(22) << record.name_eng
                  << std::right << std::fixed << std::setprecision(4) << std::setw(9) << record.latitude << "  "
                  << std::setw(9) << FormatTemperatureRange(record) << "  code " << record.weather_code << "\n";
    }
}

int RunWorkflow(const AppConfig& config, const CliOptions& cli) {
    DownloadConfig download = config.download;
    download.dry_run = cli.dry_run;
    ForecastDownloadService downloads(download);

    std::string today = TimeUtil::TodayDate();
    if (config.download_enabled && !cli.no_download) {
        DownloadResult result;
        Error error;
        if (!downloads.Download(today, &result, &error)) {
            std::cerr << "Download: " << FormatError(error) << ", using local copy\n";
        }
    } else {
        std::cout << "Download: skipped\n";
    }

    ParsedFeed feed;
    if (!LoadFeed(config, downloads, &feed)) {
        return 1;
    }

    Error error;
    ForecastDateResolver resolver(config.expected_city_count);
    ResolveResult resolved;
    std::string target = cli.date.empty() ? today : cli.date;
    if (!resolver.Resolve(feed.dataset, target, &resolved, &error)) {
        std::cerr << "Resolve: " << FormatError(error) << "\n";
        return 1;
    }

    CityForecastSet set = CityForecastSet::Build(resolved.effective_date, resolved.records, &resolved.warnings);
    PrintCityTable(set);
    for (const auto& warning : resolved.warnings) {
        std::cerr << "Warning: " << warning.message << "\n";
    }
    if (cli.strict && !resolved.warnings.empty()) {
        std::cerr << "Strict mode: " << resolved.warnings.size() << " warning(s), not rendering\n";
        return 1;
    }

    WeatherCodeMapping mapping;
    if (!WeatherCodeMapping::LoadFromFile(config.weather_codes_path, &mapping, &error)) {
        std::cerr << "Mapping: " << FormatError(error) << "\n";
        return 1;
    }

    ShapingMode mode = ShapingMode::Auto;
    if (!ParseShapingMode(config.shaping_mode, &mode)) {
        std::cerr << "Invalid shaping_mode '" << config.shaping_mode << "'\n";
        return 1;
    }
    std::unique_ptr<TextShapingStrategy> shaper = CreateShapingStrategy(mode, &error);
    if (!shaper) {
        std::cerr << "Text: " << FormatError(error) << "\n";
        return 1;
    }

    GradientSeedPolicy policy = GradientSeedPolicy::PerDate;
    if (!ParseGradientSeedPolicy(config.gradient_seed_policy, &policy)) {
        std::cerr << "Invalid gradient_seed_policy '" << config.gradient_seed_policy << "'\n";
        return 1;
    }
    uint32_t seed = cli.has_seed ? cli.seed : ResolveGradientSeed(policy, set.Date(), config.gradient_seed);

    if (SDL_Init(0) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }
    int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
    if ((IMG_Init(img_flags) & img_flags) != img_flags) {
        std::cerr << "IMG_Init failed: " << IMG_GetError() << "\n";
    }

    int status = 0;
    {
        FontLibrary fonts;
        ImageAssembler assembler(config.render, mapping, *shaper, &fonts);
        RenderedImage image;
        if (!assembler.Render(set, seed, &image, &error)) {
            std::cerr << "Render: " << FormatError(error) << "\n";
            status = 1;
        } else if (cli.dry_run) {
            std::cout << "Card: dry run, " << image.bytes.size() << " bytes not written\n";
        } else {
            std::string output = cli.output_path.empty() ? config.output_path : cli.output_path;
            if (!image.WriteToFile(output, &error)) {
                std::cerr << "Render: " << FormatError(error) << "\n";
                status = 1;
            }
        }
    }

    IMG_Quit();
    SDL_Quit();
    return status;
}

int main(int argc, char** argv) {
    CliOptions cli;
    if (!ParseArgs(argc, argv, &cli)) {
        PrintUsage(argv[0]);
        return 2;
    }

    AppConfig config;
    if (!LoadConfig(cli.config_path, &config)) {
        return 1;
    }

    auto start = std::chrono::steady_clock::now();
    std::cout << "Forecast card started " << TimeUtil::FormatTimestamp(static_cast<time_t>(TimeUtil::NowTs())) << "\n";

    int status = RunWorkflow(config, cli);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    std::cout << "Forecast card " << (status == 0 ? "finished" : "failed") << " "
              << TimeUtil::FormatTimestamp(static_cast<time_t>(TimeUtil::NowTs())) << " ("
              << std::fixed << std::setprecision(1) << elapsed.count() / 1000.0 << "s)\n";
    return status;
}
