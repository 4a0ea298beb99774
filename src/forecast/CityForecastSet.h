#pragma once

#include "model/ForecastRecord.h"

#include <cstddef>
#include <string>
#include <vector>

enum class WarningKind {
    CityCountMismatch,
    DuplicateCity
};

// Non-fatal finding about resolved data. Returned to the caller, never thrown.
struct ValidationWarning {
    WarningKind kind = WarningKind::CityCountMismatch;
    std::string message;
    size_t expected = 0;
    size_t actual = 0;
};

// Records for one effective date, one per city, north to south.
class CityForecastSet {
public:
    CityForecastSet() = default;

    // Drops records whose city id was already seen (first one wins) and
    // sorts the rest by descending latitude.
    static CityForecastSet Build(const std::string& date,
                                 std::vector<ForecastRecord> records,
                                 std::vector<ValidationWarning>* warnings);

    const std::string& Date() const { return date_; }
    const std::vector<ForecastRecord>& Records() const { return records_; }
    size_t Size() const { return records_.size(); }
    bool Empty() const { return records_.empty(); }

private:
    CityForecastSet(std::string date, std::vector<ForecastRecord> records);

    std::string date_;
    std::vector<ForecastRecord> records_;
};
