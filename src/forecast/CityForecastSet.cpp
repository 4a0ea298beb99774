#include "forecast/CityForecastSet.h"

#include "forecast/GeoSorter.h"

#include <unordered_set>
#include <utility>

CityForecastSet::CityForecastSet(std::string date, std::vector<ForecastRecord> records)
    : date_(std::move(date)), records_(std::move(records)) {}

CityForecastSet CityForecastSet::Build(const std::string& date,
                                       std::vector<ForecastRecord> records,
                                       std::vector<ValidationWarning>* warnings) {
    std::unordered_set<std::string> seen;
    std::vector<ForecastRecord> unique;
    unique.reserve(records.size());
    for (auto& record : records) {
        if (!seen.insert(record.city_id).second) {
            if (warnings) {
                ValidationWarning warning;
                warning.kind = WarningKind::DuplicateCity;
                warning.message = "duplicate city id '" + record.city_id + "' on " + date + " dropped";
                warnings->push_back(std::move(warning));
            }
            continue;
        }
        unique.push_back(std::move(record));
    }
    return CityForecastSet(date, SortNorthToSouth(std::move(unique)));
}
