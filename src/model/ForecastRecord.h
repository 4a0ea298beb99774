#pragma once

#include <map>
#include <string>
#include <vector>

// One city's forecast for one date. Built by the ingestion layer and only
// read afterwards.
struct ForecastRecord {
    std::string city_id;
    std::string name_eng;
    std::string name_heb;
    double latitude = 0.0;
    double longitude = 0.0;
    std::string date; // YYYY-MM-DD
    int max_temp_c = 0;
    int min_temp_c = 0;
    int weather_code = -1;

    bool has_humidity = false;
    int min_humidity = 0;
    int max_humidity = 0;

    std::string wind; // empty when not published
};

// Date (YYYY-MM-DD) -> records for that date, in feed order. std::map keeps
// the keys in chronological order for this date format.
using ForecastDataset = std::map<std::string, std::vector<ForecastRecord>>;

std::string FormatTemperatureRange(const ForecastRecord& record);
