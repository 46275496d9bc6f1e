#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <map>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace Utils {
inline std::string to_lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

inline std::string trim(std::string_view value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return "";
    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(begin, end - begin + 1));
}

inline std::string join(const std::vector<std::string>& items, std::string_view separator) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += separator;
        out += items[i];
    }
    return out;
}

inline bool contains(const std::vector<std::string>& items, std::string_view value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

// base_path/category, the folder the device should download into
inline std::string destination_folder(const std::string& base_path, const std::string& category) {
    return (std::filesystem::path(base_path) / category).string();
}

// 1536 -> "1.5 KB"
inline std::string format_bytes(int64_t bytes) {
    if (bytes == 0) return "0 B";
    static const char* sizes[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    size_t i = 0;
    while (value >= 1024 && i < 4) {
        value /= 1024.0;
        ++i;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value << " " << sizes[i];
    return ss.str();
}

// "Show Stagione 3" -> "Show S03"
inline std::string clean_name(const std::string& name) {
    static const std::regex season(R"(\bstagione[\s\-_:]*([0-9]+)\b)", std::regex::icase);
    std::string out;
    auto it = std::sregex_iterator(name.begin(), name.end(), season);
    size_t last = 0;
    for (; it != std::sregex_iterator(); ++it) {
        const std::smatch& m = *it;
        std::string number = m[1].str();
        if (number.size() < 2) number.insert(0, 2 - number.size(), '0');
        out += name.substr(last, static_cast<size_t>(m.position(0)) - last);
        out += "S" + number;
        last = static_cast<size_t>(m.position(0) + m.length(0));
    }
    out += name.substr(last);
    return out;
}

// Translate a caller-supplied category alias ("serie", "film") to the configured
// category it belongs to. Unmapped categories come back unchanged.
inline std::string map_category(const std::string& category,
                                const std::map<std::string, std::vector<std::string>>& mapping) {
    const std::string lowered = to_lower(category);
    for (const auto& [target, aliases] : mapping) {
        if (contains(aliases, lowered)) return target;
    }
    return category;
}

inline const char* get_env(const char* key) {
    const char* value = std::getenv(key);
    return value ? value : "";
}
}  // namespace Utils
