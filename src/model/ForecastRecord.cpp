#include "model/ForecastRecord.h"

std::string FormatTemperatureRange(const ForecastRecord& record) {
    return std::to_string(record.min_temp_c) + "-" + std::to_string(record.max_temp_c) + "\xC2\xB0" "C";
}
