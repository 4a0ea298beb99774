#include "forecast/ForecastDateResolver.h"

#include "util/TimeUtil.h"

#include <iostream>

ForecastDateResolver::ForecastDateResolver(size_t expected_city_count)
    : expected_city_count_(expected_city_count) {}

bool ForecastDateResolver::Resolve(const ForecastDataset& dataset,
                                   const std::string& target_date,
                                   ResolveResult* out,
                                   Error* error) const {
    if (!TimeUtil::IsValidDate(target_date)) {
        return SetError(error, ErrorCode::InvalidInput, "target date is not YYYY-MM-DD: '" + target_date + "'");
    }

    ResolveResult result;
    result.requested_date = target_date;

    auto exact = dataset.find(target_date);
    if (exact != dataset.end() && !exact->second.empty()) {
        result.effective_date = target_date;
        result.records = exact->second;
    } else {
        std::cout << "Resolver: no records for " << target_date << ", scanning later dates\n";
        for (auto it = dataset.upper_bound(target_date); it != dataset.end(); ++it) {
            if (it->second.empty()) {
                std::cout << "Resolver: no records for " << it->first << ", trying next date\n";
                continue;
            }
            result.effective_date = it->first;
            result.records = it->second;
            result.used_fallback = true;
            break;
        }
    }

    if (result.records.empty()) {
        return SetError(error, ErrorCode::DataUnavailable,
                        "no forecast records on or after " + target_date +
                        " (" + std::to_string(dataset.size()) + " dates in dataset)");
    }

    if (result.used_fallback) {
        std::cout << "Resolver: using " << result.effective_date << " instead of requested "
                  << result.requested_date << "\n";
    } else {
        std::cout << "Resolver: using requested date " << result.effective_date << "\n";
    }

    if (result.records.size() != expected_city_count_) {
        ValidationWarning warning;
        warning.kind = WarningKind::CityCountMismatch;
        warning.expected = expected_city_count_;
        warning.actual = result.records.size();
        warning.message = "city count mismatch on " + result.effective_date + ": expected " +
                          std::to_string(expected_city_count_) + ", got " +
                          std::to_string(result.records.size());
        result.warnings.push_back(std::move(warning));
    }

    *out = std::move(result);
    return true;
}

std::vector<std::string> AvailableDates(const ForecastDataset& dataset) {
    std::vector<std::string> dates;
    dates.reserve(dataset.size());
    for (const auto& [date, _] : dataset) {
        dates.push_back(date);
    }
    return dates;
}
