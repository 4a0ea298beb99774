#include "forecast/GeoSorter.h"

#include <algorithm>

std::vector<ForecastRecord> SortNorthToSouth(std::vector<ForecastRecord> records) {
    std::stable_sort(records.begin(), records.end(), [](const ForecastRecord& a, const ForecastRecord& b) {
        return a.latitude > b.latitude;
    });
    return records;
}

bool IsSortedNorthToSouth(const std::vector<ForecastRecord>& records) {
    return std::is_sorted(records.begin(), records.end(), [](const ForecastRecord& a, const ForecastRecord& b) {
        return a.latitude > b.latitude;
    });
}
