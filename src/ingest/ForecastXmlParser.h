#pragma once

#include "model/ForecastRecord.h"
#include "util/Error.h"

#include <cstddef>
#include <string>
#include <vector>

struct ParsedFeed {
    std::string issue_datetime; // empty when the feed has none
    ForecastDataset dataset;
    std::vector<std::string> available_dates; // ascending
    size_t location_count = 0;
    size_t skipped_records = 0; // (city, date) entries missing required fields
};

// Reads the IMS multi-city forecast XML (ISO-8859-8 or UTF-8; libxml2 honours
// the declared encoding) into per-date record lists.
class ForecastXmlParser {
public:
    bool ParseFile(const std::string& path, ParsedFeed* out, Error* error) const;
    bool ParseMemory(const std::string& xml, ParsedFeed* out, Error* error) const;
};
