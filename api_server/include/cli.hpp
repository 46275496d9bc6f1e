#pragma once

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Command {
inline constexpr std::string_view HOST = "--host";
inline constexpr std::string_view PORT = "--port";
inline constexpr std::string_view CONFIG_FILE = "--config";
inline constexpr std::string_view LOG_FILE = "--log-file";
inline constexpr std::string_view VERBOSE = "--verbose";
inline constexpr std::string_view HELP = "--help";
}  // namespace Command

struct Options {
    std::string host = "0.0.0.0";
    uint16_t port = 5000;
    std::string config_path = "config/config.json";
    std::string log_file;
    bool verbose = false;
    bool help = false;
};

namespace Cli {
inline void print_usage() {
    std::cerr << "usage:\n"
              << "    jdbridge_server [--host HOST] [--port PORT] [--config FILE] [--log-file FILE] [--verbose]\n";
}

// Returns false (after printing why) when the arguments make no sense.
inline bool parse(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string value;
        if (arg == Command::HELP) {
            options.help = true;
        } else if (arg == Command::VERBOSE) {
            options.verbose = true;
        } else if (arg == Command::HOST) {
            if (!next(options.host)) return false;
        } else if (arg == Command::CONFIG_FILE) {
            if (!next(options.config_path)) return false;
        } else if (arg == Command::LOG_FILE) {
            if (!next(options.log_file)) return false;
        } else if (arg == Command::PORT) {
            if (!next(value)) return false;
            try {
                const int port = std::stoi(value);
                if (port <= 0 || port > 65535) throw std::out_of_range(value);
                options.port = static_cast<uint16_t>(port);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid port: " << value << "\n";
                return false;
            }
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }
    }
    return true;
}
}  // namespace Cli
