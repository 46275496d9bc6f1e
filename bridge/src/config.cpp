#include "config.hpp"

#include <filesystem>
#include <fstream>

#include "error.hpp"
#include "utils.hpp"

namespace Config {
CONFIG from_json(const json& data) {
    CONFIG config;
    try {
        const json myjd = data.value("MyJD", json::object());
        config.credentials.username = myjd.value("username", "");
        config.credentials.password = myjd.value("password", "");
        config.credentials.app_key = myjd.value("appkey", "");
        config.credentials.device_id = myjd.value("deviceid", "");
        config.api_url = myjd.value("api_url", config.api_url);
        config.timeout_seconds = myjd.value("timeout_seconds", config.timeout_seconds);

        const json downloads = data.value("Downloads", json::object());
        config.base_path = downloads.value("base_path", config.base_path);
        config.allowed_categories = downloads.value("allowed_categories", config.allowed_categories);
        config.mapping_categories = downloads.value("mapping_categories", config.mapping_categories);
    } catch (const json::exception& e) {
        throw Error::ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }
    for (auto& [target, aliases] : config.mapping_categories) {
        for (auto& alias : aliases) alias = Utils::to_lower(alias);
    }
    return config;
}

CONFIG load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw Error::ConfigurationError("Configuration file not found: " + path);
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw Error::ConfigurationError("Cannot open configuration file: " + path);
    }
    json data = json::parse(file, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw Error::ConfigurationError("Failed to parse configuration file: " + path);
    }
    CONFIG config = from_json(data);
    apply_env_overrides(config);
    validate(config);
    return config;
}

void apply_env_overrides(CONFIG& config) {
    auto override_with = [](std::string& field, const char* key) {
        const std::string value = Utils::get_env(key);
        if (!value.empty()) field = value;
    };
    override_with(config.credentials.username, "MYJD_USERNAME");
    override_with(config.credentials.password, "MYJD_PASSWORD");
    override_with(config.credentials.app_key, "MYJD_APPKEY");
    override_with(config.credentials.device_id, "MYJD_DEVICEID");
}

void validate(const CONFIG& config) {
    const std::pair<const char*, const std::string*> required[] = {
        {"MyJD.username", &config.credentials.username}, {"MyJD.password", &config.credentials.password},
        {"MyJD.appkey", &config.credentials.app_key},     {"MyJD.deviceid", &config.credentials.device_id},
        {"Downloads.base_path", &config.base_path},
    };
    for (const auto& [name, value] : required) {
        if (Utils::trim(*value).empty()) {
            throw Error::ConfigurationError(std::string("Missing required setting: ") + name);
        }
    }
    if (config.allowed_categories.empty()) {
        throw Error::ConfigurationError("Downloads.allowed_categories must not be empty");
    }
    if (config.timeout_seconds <= 0) {
        throw Error::ConfigurationError("MyJD.timeout_seconds must be positive");
    }
}

json public_view(const CONFIG& config) {
    return {{"base_path", config.base_path},
            {"allowed_categories", config.allowed_categories},
            {"device_id", config.credentials.device_id},
            {"username", config.credentials.username}};
}
}  // namespace Config
