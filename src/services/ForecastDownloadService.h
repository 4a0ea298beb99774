#pragma once

#include "util/Error.h"

#include <string>

struct DownloadConfig {
    std::string url = "https://ims.gov.il/sites/default/files/ims_data/xml_files/isr_cities.xml";
    std::string xml_path = "data/isr_cities.xml";
    std::string archive_dir = "archive";
    int timeout_sec = 30;
    int max_retries = 3;
    int retry_delay_sec = 2;
    int retention_days = 14;
    bool dry_run = false;
};

struct DownloadResult {
    size_t bytes = 0;
    int attempts = 0;
    std::string archive_path;
    int archives_deleted = 0;
};

// Fetches the feed, keeps the current copy at xml_path plus one dated copy
// per day in archive_dir, and prunes archives past the retention window.
class ForecastDownloadService {
public:
    explicit ForecastDownloadService(const DownloadConfig& config);

    bool Download(const std::string& today, DownloadResult* result, Error* error);

    // Writes a fetched feed body to xml_path and the archive copy for
    // `today` (nothing in dry run), then prunes old archives.
    bool SaveFeed(const std::string& today, const std::string& body, DownloadResult* result, Error* error);

    // Deletes isr_cities_<date>.xml files dated on or before `today` minus
    // the retention window. Files with malformed names are left alone.
    int CleanupArchives(const std::string& today) const;

    std::string ArchivePath(const std::string& date) const;
    std::string NewestArchive() const; // empty when there is none

    static bool ArchiveDateFromName(const std::string& filename, std::string* date);

private:
    bool Fetch(std::string* body, int* attempts, Error* error) const;

    DownloadConfig config_;
};
