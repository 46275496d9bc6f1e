#include "client.hpp"

#include "error.hpp"
#include "log.hpp"
#include "retry.hpp"
#include "utils.hpp"

MyJDClient::MyJDClient(Connection& connection, const CONFIG& config) : m_connection(connection), m_config(config) {}

void MyJDClient::ensure_connected() {
    if (!m_connection.is_connected()) m_connection.connect();
}

OperationResult MyJDClient::add_download_package(const DownloadRequest& request) {
    return add_download_package(request.name, request.links, request.category, request.auto_start);
}

OperationResult MyJDClient::add_download_package(const std::string& name, const std::vector<std::string>& links,
                                                 const std::string& category, bool auto_start) {
    try {
        ensure_connected();
    } catch (const Error::ConnectionError& e) {
        return OperationResult::fail(ErrorKind::Connection, e.what());
    }

    if (Utils::trim(name).empty()) {
        Log::warn("Download name is empty.");
        return OperationResult::fail(ErrorKind::Validation, "Package name is empty");
    }
    if (links.empty()) {
        Log::warn("Download links are invalid or empty.");
        return OperationResult::fail(ErrorKind::Validation, "No download links provided");
    }
    if (!Utils::contains(m_config.allowed_categories, category)) {
        Log::warn("Category '" + category + "' is not allowed.");
        return OperationResult::fail(ErrorKind::Validation, "Invalid category: " + category + ". Allowed categories: " +
                                                                Utils::join(m_config.allowed_categories, ", "));
    }

    LinkPackage package;
    package.package_name = name;
    package.links = Utils::join(links, "\n");
    package.destination_folder = Utils::destination_folder(m_config.base_path, category);
    package.auto_start = auto_start;

    Log::debug("Adding package '" + name + "' to " + package.destination_folder);
    try {
        Retry::run(m_connection, "Add links", [&package](Device& device) { device.submit_links(package); });
    } catch (const std::exception& e) {
        Log::error(std::string("Failed to add download package: ") + e.what());
        throw Error::OperationError(std::string("Failed to add package: ") + e.what());
    }
    Log::info("Added download package '" + name + "' with " + std::to_string(links.size()) + " links");
    return OperationResult::ok("Successfully added download package: " + name);
}

std::vector<DownloadPackage> MyJDClient::get_download_packages() {
    ensure_connected();
    std::vector<json> records;
    try {
        records = Retry::run(m_connection, "Query packages", [](Device& device) { return device.query_downloads(); });
    } catch (const Error::ConnectionError&) {
        throw;
    } catch (const std::exception& e) {
        Log::error(std::string("Failed to get download packages: ") + e.what());
        throw Error::OperationError(std::string("Failed to get packages: ") + e.what());
    }

    std::vector<DownloadPackage> packages;
    packages.reserve(records.size());
    for (const auto& record : records) {
        packages.push_back(DownloadPackage::from_record(record));
    }
    return packages;
}

std::vector<json> MyJDClient::get_linkgrabber_packages() {
    ensure_connected();
    try {
        return Retry::run(m_connection, "Query linkgrabber",
                          [](Device& device) { return device.query_pending_links(); });
    } catch (const Error::ConnectionError&) {
        throw;
    } catch (const std::exception& e) {
        Log::error(std::string("Failed to get linkgrabber packages: ") + e.what());
        throw Error::OperationError(std::string("Failed to get linkgrabber packages: ") + e.what());
    }
}

bool MyJDClient::start_downloads(const std::optional<std::vector<std::string>>& package_ids) {
    ensure_connected();
    try {
        if (package_ids && !package_ids->empty()) {
            Retry::run(m_connection, "Start packages",
                       [&package_ids](Device& device) { device.start_packages(*package_ids); });
            Log::info("Started downloads for packages: " + Utils::join(*package_ids, ", "));
        } else {
            Retry::run(m_connection, "Start downloads", [](Device& device) { device.start_all(); });
            Log::info("Started all downloads");
        }
    } catch (const Error::ConnectionError&) {
        throw;
    } catch (const std::exception& e) {
        Log::error(std::string("Failed to start downloads: ") + e.what());
        throw Error::OperationError(std::string("Failed to start downloads: ") + e.what());
    }
    return true;
}

bool MyJDClient::pause_downloads(const std::optional<std::vector<std::string>>& package_ids) {
    ensure_connected();
    try {
        if (package_ids && !package_ids->empty()) {
            Retry::run(m_connection, "Pause packages",
                       [&package_ids](Device& device) { device.pause_packages(*package_ids); });
            Log::info("Paused downloads for packages: " + Utils::join(*package_ids, ", "));
        } else {
            Retry::run(m_connection, "Pause downloads", [](Device& device) { device.pause_all(); });
            Log::info("Paused all downloads");
        }
    } catch (const Error::ConnectionError&) {
        throw;
    } catch (const std::exception& e) {
        Log::error(std::string("Failed to pause downloads: ") + e.what());
        throw Error::OperationError(std::string("Failed to pause downloads: ") + e.what());
    }
    return true;
}
