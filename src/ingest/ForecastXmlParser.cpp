#include "ingest/ForecastXmlParser.h"

#include "util/TimeUtil.h"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>

namespace {

struct DocDeleter {
    void operator()(xmlDoc* doc) const {
        if (doc) {
            xmlFreeDoc(doc);
        }
    }
};

using DocPtr = std::unique_ptr<xmlDoc, DocDeleter>;

constexpr int kParseOptions = XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOWARNING;

bool IsElement(const xmlNode* node, const char* name) {
    return node && node->type == XML_ELEMENT_NODE &&
           std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

xmlNode* FirstChild(xmlNode* parent, const char* name) {
    for (xmlNode* child = parent ? parent->children : nullptr; child; child = child->next) {
        if (IsElement(child, name)) {
            return child;
        }
    }
    return nullptr;
}

std::string Trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string NodeText(xmlNode* node) {
    if (!node) {
        return "";
    }
    xmlChar* content = xmlNodeGetContent(node);
    if (!content) {
        return "";
    }
    std::string text(reinterpret_cast<const char*>(content));
    xmlFree(content);
    return Trim(text);
}

std::string ChildText(xmlNode* parent, const char* name) {
    return NodeText(FirstChild(parent, name));
}

bool ParseNumber(const std::string& text, double* out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
        return false;
    }
    *out = value;
    return true;
}

bool ParseRoundedInt(const std::string& text, int* out) {
    double value = 0.0;
    if (!ParseNumber(text, &value)) {
        return false;
    }
    *out = static_cast<int>(std::lround(value));
    return true;
}

xmlNode* FindDescendant(xmlNode* node, const char* name) {
    for (xmlNode* child = node ? node->children : nullptr; child; child = child->next) {
        if (IsElement(child, name)) {
            return child;
        }
        if (xmlNode* found = FindDescendant(child, name)) {
            return found;
        }
    }
    return nullptr;
}

void CollectLocations(xmlNode* node, std::vector<xmlNode*>* out) {
    for (xmlNode* child = node ? node->children : nullptr; child; child = child->next) {
        if (IsElement(child, "Location")) {
            out->push_back(child);
        } else if (child->type == XML_ELEMENT_NODE) {
            CollectLocations(child, out);
        }
    }
}

struct CityMeta {
    std::string id;
    std::string name_eng;
    std::string name_heb;
    double latitude = 0.0;
    double longitude = 0.0;
};

bool ReadCityMeta(xmlNode* location, CityMeta* meta) {
    xmlNode* node = FirstChild(location, "LocationMetaData");
    if (!node) {
        return false;
    }
    meta->name_eng = ChildText(node, "LocationNameEng");
    meta->name_heb = ChildText(node, "LocationNameHeb");
    meta->id = ChildText(node, "LocationId");
    if (meta->id.empty()) {
        meta->id = meta->name_eng;
    }
    return !meta->name_eng.empty() && !meta->name_heb.empty() &&
           ParseNumber(ChildText(node, "DisplayLat"), &meta->latitude) &&
           ParseNumber(ChildText(node, "DisplayLon"), &meta->longitude);
}

// Missing names are reported back through `missing` for the log line.
bool ReadTimeUnit(xmlNode* unit, const CityMeta& meta, ForecastRecord* record, std::string* missing) {
    record->city_id = meta.id;
    record->name_eng = meta.name_eng;
    record->name_heb = meta.name_heb;
    record->latitude = meta.latitude;
    record->longitude = meta.longitude;
    record->date = ChildText(unit, "Date");

    bool has_max = false;
    bool has_min = false;
    bool has_code = false;
    bool has_max_humidity = false;
    bool has_min_humidity = false;
    for (xmlNode* element = unit->children; element; element = element->next) {
        if (!IsElement(element, "Element")) {
            continue;
        }
        std::string name = ChildText(element, "ElementName");
        std::string value = ChildText(element, "ElementValue");
        if (name == "Maximum temperature") {
            has_max = ParseRoundedInt(value, &record->max_temp_c);
        } else if (name == "Minimum temperature") {
            has_min = ParseRoundedInt(value, &record->min_temp_c);
        } else if (name == "Weather code") {
            has_code = ParseRoundedInt(value, &record->weather_code);
        } else if (name == "Maximum relative humidity") {
            has_max_humidity = ParseRoundedInt(value, &record->max_humidity);
        } else if (name == "Minimum relative humidity") {
            has_min_humidity = ParseRoundedInt(value, &record->min_humidity);
        } else if (name == "Wind direction and speed") {
            record->wind = value;
        }
    }
    record->has_humidity = has_max_humidity && has_min_humidity;

    missing->clear();
    if (!TimeUtil::IsValidDate(record->date)) {
        *missing += " date";
    }
    if (!has_max) {
        *missing += " max_temp";
    }
    if (!has_min) {
        *missing += " min_temp";
    }
    if (!has_code) {
        *missing += " weather_code";
    }
    return missing->empty();
}

bool ParseDocument(xmlDoc* doc, ParsedFeed* out, Error* error) {
    xmlNode* root = xmlDocGetRootElement(doc);
    if (!root) {
        return SetError(error, ErrorCode::ParseFailure, "feed has no root element");
    }

    ParsedFeed feed;
    feed.issue_datetime = NodeText(FindDescendant(root, "IssueDateTime"));

    std::vector<xmlNode*> locations;
    CollectLocations(root, &locations);
    if (locations.empty()) {
        return SetError(error, ErrorCode::ParseFailure, "feed contains no Location elements");
    }

    for (xmlNode* location : locations) {
        CityMeta meta;
        if (!ReadCityMeta(location, &meta)) {
            std::cerr << "Feed: skipping location '" << meta.name_eng << "' with incomplete metadata\n";
            ++feed.skipped_records;
            continue;
        }
        ++feed.location_count;

        xmlNode* data = FirstChild(location, "LocationData");
        for (xmlNode* unit = data ? data->children : nullptr; unit; unit = unit->next) {
            if (!IsElement(unit, "TimeUnitData")) {
                continue;
            }
            ForecastRecord record;
            std::string missing;
            if (!ReadTimeUnit(unit, meta, &record, &missing)) {
                std::cerr << "Feed: " << meta.name_eng << " " << record.date << " missing" << missing << "\n";
                ++feed.skipped_records;
                continue;
            }
            feed.dataset[record.date].push_back(std::move(record));
        }
    }

    for (const auto& entry : feed.dataset) {
        feed.available_dates.push_back(entry.first);
    }
    std::cout << "Feed: " << feed.location_count << " locations, " << feed.available_dates.size() << " dates";
    if (!feed.issue_datetime.empty()) {
        std::cout << ", issued " << feed.issue_datetime;
    }
    std::cout << "\n";

    *out = std::move(feed);
    return true;
}

std::string LastXmlError() {
    const xmlError* err = xmlGetLastError();
    if (!err || !err->message) {
        return "unknown error";
    }
    return Trim(err->message) + " (line " + std::to_string(err->line) + ")";
}

} // namespace

bool ForecastXmlParser::ParseFile(const std::string& path, ParsedFeed* out, Error* error) const {
    xmlResetLastError();
    DocPtr doc(xmlReadFile(path.c_str(), nullptr, kParseOptions));
    if (!doc) {
        return SetError(error, ErrorCode::ParseFailure, "cannot parse " + path + ": " + LastXmlError());
    }
    return ParseDocument(doc.get(), out, error);
}

bool ForecastXmlParser::ParseMemory(const std::string& xml, ParsedFeed* out, Error* error) const {
    xmlResetLastError();
    DocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "feed.xml", nullptr, kParseOptions));
    if (!doc) {
        return SetError(error, ErrorCode::ParseFailure, "cannot parse feed: " + LastXmlError());
    }
    return ParseDocument(doc.get(), out, error);
}
