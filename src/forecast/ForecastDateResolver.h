#pragma once

#include "forecast/CityForecastSet.h"
#include "model/ForecastRecord.h"
#include "util/Error.h"

#include <cstddef>
#include <string>
#include <vector>

struct ResolveResult {
    std::string requested_date;
    std::string effective_date;
    bool used_fallback = false;
    std::vector<ForecastRecord> records;
    std::vector<ValidationWarning> warnings;
};

// Picks the date to render. The requested date wins when it has at least
// one record; otherwise the next later date in the dataset that has any.
class ForecastDateResolver {
public:
    explicit ForecastDateResolver(size_t expected_city_count);

    bool Resolve(const ForecastDataset& dataset,
                 const std::string& target_date,
                 ResolveResult* out,
                 Error* error) const;

private:
    size_t expected_city_count_;
};

std::vector<std::string> AvailableDates(const ForecastDataset& dataset);
