#include "model/WeatherCodeMapping.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <sstream>

bool WeatherCodeMapping::Create(const std::map<int, std::string>& codes,
                                const std::string& fallback_id,
                                WeatherCodeMapping* out,
                                Error* error) {
    if (fallback_id.empty()) {
        return SetError(error, ErrorCode::InvalidInput, "weather code mapping has no fallback icon");
    }
    for (const auto& [code, id] : codes) {
        if (id.empty()) {
            return SetError(error, ErrorCode::InvalidInput,
                            "weather code " + std::to_string(code) + " maps to an empty icon id");
        }
    }
    out->codes_ = codes;
    out->fallback_id_ = fallback_id;
    return true;
}

bool WeatherCodeMapping::LoadFromFile(const std::string& path, WeatherCodeMapping* out, Error* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return SetError(error, ErrorCode::InvalidInput, "weather code mapping not found: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromJson(buffer.str(), out, error);
}

bool WeatherCodeMapping::LoadFromJson(const std::string& text, WeatherCodeMapping* out, Error* error) {
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return SetError(error, ErrorCode::InvalidInput, "weather code mapping is not a JSON object");
    }

    std::string fallback = j.value("fallback", std::string{});
    std::map<int, std::string> codes;
    if (j.contains("codes")) {
        const auto& table = j["codes"];
        if (!table.is_object()) {
            return SetError(error, ErrorCode::InvalidInput, "weather code mapping: 'codes' must be an object");
        }
        for (auto it = table.begin(); it != table.end(); ++it) {
            int code = 0;
            try {
                size_t used = 0;
                code = std::stoi(it.key(), &used);
                if (used != it.key().size()) {
                    throw std::invalid_argument(it.key());
                }
            } catch (const std::exception&) {
                return SetError(error, ErrorCode::InvalidInput, "weather code mapping: bad code '" + it.key() + "'");
            }
            if (!it.value().is_string()) {
                return SetError(error, ErrorCode::InvalidInput,
                                "weather code mapping: icon for " + it.key() + " must be a string");
            }
            codes[code] = it.value().get<std::string>();
        }
    }
    return Create(codes, fallback, out, error);
}

const std::string& WeatherCodeMapping::Resolve(int code) const {
    auto it = codes_.find(code);
    if (it == codes_.end()) {
        return fallback_id_;
    }
    return it->second;
}

bool WeatherCodeMapping::IsMapped(int code) const {
    return codes_.find(code) != codes_.end();
}

std::vector<std::string> WeatherCodeMapping::AssetIds() const {
    std::set<std::string> ids;
    ids.insert(fallback_id_);
    for (const auto& [_, id] : codes_) {
        ids.insert(id);
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}
