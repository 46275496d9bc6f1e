#include <string>

#include "types.h"
#include "utils.hpp"

namespace {
int64_t number_or(const json& record, const char* key, int64_t fallback) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_number()) return fallback;
    return it->get<int64_t>();
}

std::string string_or(const json& record, const char* key, const std::string& fallback) {
    auto it = record.find(key);
    if (it == record.end()) return fallback;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    return fallback;
}
}  // namespace

DownloadStatus status_from_string(std::string_view status) {
    const std::string s = Utils::to_lower(status);
    if (s == Status::Downloading) return DownloadStatus::Downloading;
    if (s == Status::Finished) return DownloadStatus::Finished;
    if (s == Status::Failed) return DownloadStatus::Failed;
    if (s == Status::Paused) return DownloadStatus::Paused;
    if (s == Status::Pending) return DownloadStatus::Pending;
    if (s == Status::Extracting) return DownloadStatus::Extracting;
    return DownloadStatus::Unknown;
}

std::string_view to_string(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::Downloading:
            return Status::Downloading;
        case DownloadStatus::Finished:
            return Status::Finished;
        case DownloadStatus::Failed:
            return Status::Failed;
        case DownloadStatus::Paused:
            return Status::Paused;
        case DownloadStatus::Pending:
            return Status::Pending;
        case DownloadStatus::Extracting:
            return Status::Extracting;
        case DownloadStatus::Unknown:
            break;
    }
    return Status::Unknown;
}

DownloadPackage DownloadPackage::from_record(const json& record) {
    DownloadPackage p;
    p.name = string_or(record, "name", "Unknown");
    p.bytes_total = number_or(record, "bytesTotal", 0);
    p.bytes_loaded = number_or(record, "bytesLoaded", 0);
    p.status = status_from_string(string_or(record, "status", std::string(Status::Unknown)));
    p.package_id = string_or(record, "uuid", "");
    p.eta = number_or(record, "eta", -1);
    p.speed = number_or(record, "speed", 0);
    return p;
}

double DownloadPackage::progress_percentage() const {
    if (bytes_total == 0) return 0.0;
    return static_cast<double>(bytes_loaded) / static_cast<double>(bytes_total) * 100.0;
}

std::string DownloadPackage::formatted_size() const { return Utils::format_bytes(bytes_total); }

std::string DownloadPackage::formatted_downloaded() const { return Utils::format_bytes(bytes_loaded); }

std::string DownloadPackage::formatted_speed() const {
    if (speed == 0) return "0 B/s";
    return Utils::format_bytes(speed) + "/s";
}

json DownloadPackage::to_json() const {
    return {{"name", name},
            {"package_id", package_id},
            {"status", std::string(to_string(status))},
            {"progress_percentage", progress_percentage()},
            {"bytes_total", bytes_total},
            {"bytes_loaded", bytes_loaded},
            {"formatted_size", formatted_size()},
            {"formatted_downloaded", formatted_downloaded()},
            {"speed", speed},
            {"formatted_speed", formatted_speed()},
            {"eta", eta},
            {"is_completed", is_completed()},
            {"is_downloading", is_downloading()}};
}
