#pragma once

#include <string>

#include "types.h"

namespace Config {
inline constexpr const char* DefaultPath = "config/config.json";

// Throws Error::ConfigurationError on malformed input or missing required fields.
CONFIG from_json(const json& data);
CONFIG load(const std::string& path = DefaultPath);

// MYJD_USERNAME, MYJD_PASSWORD, MYJD_APPKEY, MYJD_DEVICEID win over the file.
void apply_env_overrides(CONFIG& config);
void validate(const CONFIG& config);

// Everything but the password, for the /api/config route.
json public_view(const CONFIG& config);
}  // namespace Config
