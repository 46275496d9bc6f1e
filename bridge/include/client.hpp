// Download operations on top of the connection: add packages, list them, start/pause.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "connection.hpp"
#include "types.h"

class MyJDClient {
   public:
    MyJDClient(Connection& connection, const CONFIG& config);

    // Validation problems come back as a failed result. Remote failures throw
    // Error::OperationError.
    OperationResult add_download_package(const std::string& name, const std::vector<std::string>& links,
                                         const std::string& category = "other", bool auto_start = true);
    OperationResult add_download_package(const DownloadRequest& request);

    // Both throw Error::ConnectionError when no session can be established and
    // Error::OperationError when the query fails.
    std::vector<DownloadPackage> get_download_packages();
    std::vector<json> get_linkgrabber_packages();

    // Empty or missing ids means every package.
    bool start_downloads(const std::optional<std::vector<std::string>>& package_ids = std::nullopt);
    bool pause_downloads(const std::optional<std::vector<std::string>>& package_ids = std::nullopt);

    Connection& connection() { return m_connection; }
    const CONFIG& config() const { return m_config; }

   private:
    void ensure_connected();

   private:
    Connection& m_connection;
    const CONFIG& m_config;
};
