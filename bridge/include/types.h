#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Status {
inline constexpr std::string_view Unknown = "unknown";
inline constexpr std::string_view Downloading = "downloading";
inline constexpr std::string_view Finished = "finished";
inline constexpr std::string_view Failed = "failed";
inline constexpr std::string_view Paused = "paused";
inline constexpr std::string_view Pending = "pending";
inline constexpr std::string_view Extracting = "extracting";
}  // namespace Status

enum class DownloadStatus { Unknown, Downloading, Finished, Failed, Paused, Pending, Extracting };

DownloadStatus status_from_string(std::string_view status);
std::string_view to_string(DownloadStatus status);

// Login data for the remote account. Never changes after the controller is built.
struct Credentials {
    std::string username;
    std::string password;
    std::string app_key;
    std::string device_id;
};

struct DownloadRequest {
    std::string name;
    std::vector<std::string> links;
    std::string category = "other";
    bool auto_start = true;
};

// What actually gets handed to the device: links already joined, folder already resolved.
struct LinkPackage {
    std::string package_name;
    std::string links;
    std::string destination_folder;
    bool auto_start = true;
};

// Snapshot of one package as the device reported it. Built by from_record.
struct DownloadPackage {
    std::string name;
    int64_t bytes_total = 0;
    int64_t bytes_loaded = 0;
    DownloadStatus status = DownloadStatus::Unknown;
    std::string package_id;
    int64_t eta = -1;
    int64_t speed = 0;

    static DownloadPackage from_record(const json& record);

    double progress_percentage() const;
    bool is_completed() const { return status == DownloadStatus::Finished; }
    bool is_downloading() const { return status == DownloadStatus::Downloading; }

    std::string formatted_size() const;
    std::string formatted_downloaded() const;
    std::string formatted_speed() const;

    json to_json() const;
};

enum class ErrorKind { None, Validation, Connection };

struct OperationResult {
    bool success = false;
    std::string message;
    ErrorKind error = ErrorKind::None;

    static OperationResult ok(const std::string& message) { return {true, message, ErrorKind::None}; }
    static OperationResult fail(ErrorKind kind, const std::string& message) { return {false, message, kind}; }
};

typedef struct Bridge_Config {
    Credentials credentials;
    std::string api_url = "https://api.jdownloader.org";
    int timeout_seconds = 30;
    std::string base_path = "/downloads";
    std::vector<std::string> allowed_categories{"other"};
    // target category -> aliases accepted from callers
    std::map<std::string, std::vector<std::string>> mapping_categories;
} CONFIG;
