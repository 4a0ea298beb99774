#pragma once

#include "model/ForecastRecord.h"

#include <vector>

// North to south: descending latitude, stable for equal latitudes.
std::vector<ForecastRecord> SortNorthToSouth(std::vector<ForecastRecord> records);
bool IsSortedNorthToSouth(const std::vector<ForecastRecord>& records);
