#pragma once

#include "util/Error.h"

#include <map>
#include <string>
#include <vector>

// Weather code -> icon asset id. Every code resolves: unmapped codes get the
// fallback id, which a mapping cannot be built without.
class WeatherCodeMapping {
public:
    static bool Create(const std::map<int, std::string>& codes,
                       const std::string& fallback_id,
                       WeatherCodeMapping* out,
                       Error* error);
    static bool LoadFromFile(const std::string& path, WeatherCodeMapping* out, Error* error);
    static bool LoadFromJson(const std::string& text, WeatherCodeMapping* out, Error* error);

    const std::string& Resolve(int code) const;
    bool IsMapped(int code) const;
    const std::string& FallbackId() const { return fallback_id_; }

    // Distinct asset ids including the fallback, sorted.
    std::vector<std::string> AssetIds() const;

private:
    std::map<int, std::string> codes_;
    std::string fallback_id_;
};
