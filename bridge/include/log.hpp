#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// stdout/stderr logging shared by the library and the server. The server answers
// requests from a thread pool, so every write goes through one mutex.
namespace Log {
enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

namespace detail {
inline std::mutex& mutex() {
    static std::mutex m;
    return m;
}

inline Level& threshold() {
    static Level level = Level::Info;
    return level;
}

inline std::ofstream& file() {
    static std::ofstream f;
    return f;
}

inline const char* level_name(Level level) {
    switch (level) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
    }
    return "?";
}

inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}
}  // namespace detail

inline void set_level(Level level) {
    std::lock_guard<std::mutex> lock(detail::mutex());
    detail::threshold() = level;
}

// Append to a log file in addition to the console. Returns false if the file can't be opened.
inline bool set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(detail::mutex());
    detail::file().open(path, std::ios::app);
    return detail::file().is_open();
}

inline void write(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(detail::mutex());
    if (level < detail::threshold()) return;
    const std::string line = detail::timestamp() + " " + detail::level_name(level) + ": " + message;
    if (level >= Level::Warn) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
    if (detail::file().is_open()) {
        detail::file() << line << std::endl;
    }
}

inline void debug(const std::string& message) { write(Level::Debug, message); }
inline void info(const std::string& message) { write(Level::Info, message); }
inline void warn(const std::string& message) { write(Level::Warn, message); }
inline void error(const std::string& message) { write(Level::Error, message); }
}  // namespace Log
