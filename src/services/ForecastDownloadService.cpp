#include "services/ForecastDownloadService.h"

#include "util/TimeUtil.h"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>

namespace {

constexpr const char* kArchivePrefix = "isr_cities_";
constexpr const char* kArchiveSuffix = ".xml";

struct HttpResponse {
    long code = 0;
    std::string body;
};

size_t WriteCallback(void* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(static_cast<const char*>(ptr), total);
    return total;
}

bool HttpGet(CURL* curl, const std::string& url, long timeout_sec, HttpResponse* out, std::string* error) {
    out->body.clear();
    out->code = 0;

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out->body);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "forecast-card/1.0");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        *error = curl_easy_strerror(res);
        return false;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out->code);
    return true;
}

bool WriteFile(const std::string& path, const std::string& body, std::string* error) {
    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            *error = ec.message();
            return false;
        }
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        *error = "cannot open for writing";
        return false;
    }
    file.write(body.data(), static_cast<std::streamsize>(body.size()));
    if (!file) {
        *error = "short write";
        return false;
    }
    return true;
}

} // namespace

ForecastDownloadService::ForecastDownloadService(const DownloadConfig& config) : config_(config) {}

std::string ForecastDownloadService::ArchivePath(const std::string& date) const {
    return (std::filesystem::path(config_.archive_dir) / (kArchivePrefix + date + kArchiveSuffix)).string();
}

bool ForecastDownloadService::ArchiveDateFromName(const std::string& filename, std::string* date) {
    const std::string prefix = kArchivePrefix;
    const std::string suffix = kArchiveSuffix;
    if (filename.size() != prefix.size() + 10 + suffix.size() ||
        filename.compare(0, prefix.size(), prefix) != 0 ||
        filename.compare(filename.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    std::string candidate = filename.substr(prefix.size(), 10);
    if (!TimeUtil::IsValidDate(candidate)) {
        return false;
    }
    *date = candidate;
    return true;
}

bool ForecastDownloadService::Fetch(std::string* body, int* attempts, Error* error) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return SetError(error, ErrorCode::DownloadFailure, "curl init failed");
    }

    int max_attempts = std::max(1, config_.max_retries);
    std::string last_error;
    bool ok = false;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        *attempts = attempt;
        HttpResponse resp;
        std::string http_error;
        if (!HttpGet(curl, config_.url, std::max(1, config_.timeout_sec), &resp, &http_error)) {
            last_error = http_error;
        } else if (resp.code != 200) {
            last_error = "HTTP " + std::to_string(resp.code);
        } else if (resp.body.empty()) {
            last_error = "empty response";
        } else {
            std::cout << "Download: " << resp.body.size() << " bytes (attempt " << attempt << "/" << max_attempts
                      << ")\n";
            *body = std::move(resp.body);
            ok = true;
            break;
        }

        std::cerr << "Download: attempt " << attempt << "/" << max_attempts << " failed: " << last_error << "\n";
        if (attempt < max_attempts) {
            std::this_thread::sleep_for(std::chrono::seconds(std::max(0, config_.retry_delay_sec)));
        }
    }
    curl_easy_cleanup(curl);

    if (!ok) {
        return SetError(error, ErrorCode::DownloadFailure,
                        "feed download failed after " + std::to_string(max_attempts) + " attempts: " + last_error);
    }
    return true;
}

bool ForecastDownloadService::Download(const std::string& today, DownloadResult* result, Error* error) {
    std::string body;
    int attempts = 0;
    std::cout << "Download: " << config_.url << "\n";
    if (!Fetch(&body, &attempts, error)) {
        return false;
    }
    if (!SaveFeed(today, body, result, error)) {
        return false;
    }
    result->attempts = attempts;
    return true;
}

bool ForecastDownloadService::SaveFeed(const std::string& today,
                                       const std::string& body,
                                       DownloadResult* result,
                                       Error* error) {
    if (!TimeUtil::IsValidDate(today)) {
        return SetError(error, ErrorCode::InvalidInput, "invalid archive date '" + today + "'");
    }
    DownloadResult out;
    out.bytes = body.size();
    out.archive_path = ArchivePath(today);

    if (config_.dry_run) {
        std::cout << "Download: dry run, would write " << config_.xml_path << " and " << out.archive_path << "\n";
    } else {
        std::string write_error;
        if (!WriteFile(config_.xml_path, body, &write_error)) {
            return SetError(error, ErrorCode::DownloadFailure,
                            "cannot save " + config_.xml_path + ": " + write_error);
        }
        if (!WriteFile(out.archive_path, body, &write_error)) {
            std::cerr << "Download: archive copy " << out.archive_path << " not saved: " << write_error << "\n";
        }
    }

    out.archives_deleted = CleanupArchives(today);
    *result = out;
    return true;
}

int ForecastDownloadService::CleanupArchives(const std::string& today) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.archive_dir, ec)) {
        return 0;
    }
    if (!TimeUtil::IsValidDate(today)) {
        std::cerr << "Archive: invalid reference date '" << today << "'\n";
        return 0;
    }
    std::string cutoff = TimeUtil::AddDays(today, -std::max(0, config_.retention_days));

    int deleted = 0;
    for (const auto& entry : std::filesystem::directory_iterator(config_.archive_dir, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::string date;
        std::string name = entry.path().filename().string();
        if (!ArchiveDateFromName(name, &date)) {
            if (name.rfind(kArchivePrefix, 0) == 0) {
                std::cerr << "Archive: skipping malformed name " << name << "\n";
            }
            continue;
        }
        if (date > cutoff) {
            continue;
        }
        if (config_.dry_run) {
            std::cout << "Archive: dry run, would delete " << name << "\n";
            ++deleted;
            continue;
        }
        std::error_code remove_ec;
        if (std::filesystem::remove(entry.path(), remove_ec)) {
            std::cout << "Archive: deleted " << name << "\n";
            ++deleted;
        } else {
            std::cerr << "Archive: cannot delete " << name << ": " << remove_ec.message() << "\n";
        }
    }
    return deleted;
}

std::string ForecastDownloadService::NewestArchive() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(config_.archive_dir, ec)) {
        return "";
    }
    std::string newest_date;
    std::string newest_path;
    for (const auto& entry : std::filesystem::directory_iterator(config_.archive_dir, ec)) {
        std::string date;
        if (entry.is_regular_file(ec) && ArchiveDateFromName(entry.path().filename().string(), &date) &&
            date > newest_date) {
            newest_date = date;
            newest_path = entry.path().string();
        }
    }
    return newest_path;
}
