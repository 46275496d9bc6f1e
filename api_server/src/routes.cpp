#include "routes.hpp"

#include <httplib.h>

#include <optional>
#include <vector>

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace Routes {
namespace {
// Shared error mapping for every endpoint that talks to the remote service.
template <typename Handler>
Reply guarded(Handler&& handler) {
    try {
        return handler();
    } catch (const Error::ValidationError& e) {
        Log::warn(std::string("Validation error: ") + e.what());
        return error_reply(httplib::StatusCode::BadRequest_400, "validation_error", e.what());
    } catch (const Error::ConnectionError& e) {
        Log::error(std::string("Connection error: ") + e.what());
        return error_reply(httplib::StatusCode::ServiceUnavailable_503, "connection_error", e.what());
    } catch (const Error::OperationError& e) {
        Log::error(std::string("Operation error: ") + e.what());
        return error_reply(httplib::StatusCode::BadRequest_400, "operation_error", e.what());
    } catch (const std::exception& e) {
        Log::error(std::string("Unexpected error: ") + e.what());
        return error_reply(httplib::StatusCode::InternalServerError_500, "internal_error", "Internal server error");
    }
}

json parse_body(const std::string& body, bool required) {
    if (Utils::trim(body).empty()) {
        if (required) throw Error::ValidationError("No JSON data provided");
        return json::object();
    }
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw Error::ValidationError("Request body must be a JSON object");
    }
    if (required && data.empty()) throw Error::ValidationError("No JSON data provided");
    return data;
}

std::vector<std::string> string_list(const json& data, const char* key) {
    std::vector<std::string> out;
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) return out;
    if (!it->is_array()) throw Error::ValidationError(std::string("'") + key + "' must be a list");
    for (const auto& item : *it) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        } else if (item.is_number_integer()) {
            out.push_back(std::to_string(item.get<int64_t>()));
        } else {
            throw Error::ValidationError(std::string("'") + key + "' must only contain strings");
        }
    }
    return out;
}

// Package ids are the device's numeric uuids.
std::vector<std::string> package_ids(const json& data) {
    std::vector<std::string> ids = string_list(data, "package_ids");
    for (const auto& id : ids) {
        const bool numeric = !id.empty() && id.size() <= 18 &&
                             id.find_first_not_of("0123456789") == std::string::npos;
        if (!numeric) throw Error::ValidationError("Invalid package id: " + id);
    }
    return ids;
}

Reply from_result(const OperationResult& result, int success_status) {
    if (result.success) return {success_status, {{"success", true}, {"message", result.message}}};
    switch (result.error) {
        case ErrorKind::Connection:
            Log::error("Connection error: " + result.message);
            return error_reply(httplib::StatusCode::ServiceUnavailable_503, "connection_error", result.message);
        case ErrorKind::Validation:
        case ErrorKind::None:
            break;
    }
    Log::warn("Validation error: " + result.message);
    return error_reply(httplib::StatusCode::BadRequest_400, "validation_error", result.message);
}

void send(httplib::Response& res, const Reply& reply) {
    res.status = reply.status;
    res.set_content(reply.body.dump(), "application/json");
}
}  // namespace

Reply error_reply(int status, const std::string& error, const std::string& message) {
    return {status, {{"success", false}, {"error", error}, {"message", message}}};
}

Reply index() {
    json endpoints = {{"health", "/api/health"},
                      {"connect", "/api/connect"},
                      {"disconnect", "/api/disconnect"},
                      {"downloads", "/api/downloads"},
                      {"start_downloads", "/api/downloads/start"},
                      {"pause_downloads", "/api/downloads/pause"},
                      {"linkgrabber", "/api/linkgrabber"},
                      {"config", "/api/config"}};
    json add_download = {{"method", "POST"},
                         {"url", "/api/downloads"},
                         {"body",
                          {{"name", "Package name"},
                           {"links", {"http://example.com/file1", "http://example.com/file2"}},
                           {"category", "tv_show|movie|other"},
                           {"auto_start", true}}}};
    return {httplib::StatusCode::OK_200,
            {{"name", "jdbridge"},
             {"version", Version},
             {"description", "REST API for MyJDownloader management"},
             {"endpoints", endpoints},
             {"documentation", {{"add_download", add_download}}}}};
}

Reply health(MyJDClient& client) {
    return guarded([&]() -> Reply {
        const bool connected = client.connection().is_connected();
        return {connected ? httplib::StatusCode::OK_200 : httplib::StatusCode::ServiceUnavailable_503,
                {{"status", connected ? "healthy" : "disconnected"},
                 {"connected", connected},
                 {"message", "jdbridge is running"}}};
    });
}

Reply connect(MyJDClient& client) {
    try {
        if (client.connection().is_connected()) {
            return {httplib::StatusCode::OK_200, {{"success", true}, {"message", "Already connected to MyJDownloader"}}};
        }
        client.connection().connect();
        return {httplib::StatusCode::OK_200,
                {{"success", true}, {"message", "Successfully connected to MyJDownloader"}}};
    } catch (const Error::ConnectionError& e) {
        Log::error(std::string("Connection error: ") + e.what());
        return error_reply(httplib::StatusCode::BadRequest_400, "connection_error", e.what());
    } catch (const std::exception& e) {
        Log::error(std::string("Unexpected error during connection: ") + e.what());
        return error_reply(httplib::StatusCode::InternalServerError_500, "internal_error", "Internal server error");
    }
}

Reply disconnect(MyJDClient& client) {
    client.connection().disconnect();
    return {httplib::StatusCode::OK_200, {{"success", true}, {"message", "Disconnected from MyJDownloader"}}};
}

Reply add_download(MyJDClient& client, const std::string& request_body) {
    return guarded([&]() -> Reply {
        const json data = parse_body(request_body, true);

        DownloadRequest request;
        request.name = data.value("name", "Unnamed Package");
        request.links = string_list(data, "links");
        request.category = data.value("category", request.category);
        request.auto_start = data.value("auto_start", request.auto_start);

        Log::info("Adding " + request.name + ": " + std::to_string(request.links.size()) + " links, category " +
                  request.category + (request.auto_start ? ", autostart" : ", no autostart"));
        const std::string mapped = Utils::map_category(request.category, client.config().mapping_categories);
        if (mapped != request.category) {
            Log::debug("Category " + request.category + " mapped to " + mapped);
            request.category = mapped;
        }
        request.name = Utils::clean_name(request.name);

        const OperationResult result = client.add_download_package(request);
        if (!result.success) return from_result(result, httplib::StatusCode::Created_201);
        return {httplib::StatusCode::Created_201,
                {{"success", true},
                 {"message", result.message},
                 {"package_name", request.name},
                 {"links_count", request.links.size()},
                 {"category", request.category}}};
    });
}

Reply get_downloads(MyJDClient& client) {
    return guarded([&]() -> Reply {
        json packages = json::array();
        for (const auto& package : client.get_download_packages()) {
            packages.push_back(package.to_json());
        }
        return {httplib::StatusCode::OK_200, {{"success", true}, {"count", packages.size()}, {"packages", packages}}};
    });
}

Reply start_downloads(MyJDClient& client, const std::string& request_body) {
    return guarded([&]() -> Reply {
        const auto ids = package_ids(parse_body(request_body, false));
        const bool success = client.start_downloads(ids);
        const std::string message =
            ids.empty() ? "Started all downloads" : "Started " + std::to_string(ids.size()) + " packages";
        return {httplib::StatusCode::OK_200, {{"success", success}, {"message", message}}};
    });
}

Reply pause_downloads(MyJDClient& client, const std::string& request_body) {
    return guarded([&]() -> Reply {
        const auto ids = package_ids(parse_body(request_body, false));
        const bool success = client.pause_downloads(ids);
        const std::string message =
            ids.empty() ? "Paused all downloads" : "Paused " + std::to_string(ids.size()) + " packages";
        return {httplib::StatusCode::OK_200, {{"success", success}, {"message", message}}};
    });
}

Reply get_linkgrabber(MyJDClient& client) {
    return guarded([&]() -> Reply {
        json packages = client.get_linkgrabber_packages();
        return {httplib::StatusCode::OK_200, {{"success", true}, {"count", packages.size()}, {"packages", packages}}};
    });
}

Reply get_config(MyJDClient& client) {
    return {httplib::StatusCode::OK_200, {{"success", true}, {"config", Config::public_view(client.config())}}};
}

void register_routes(httplib::Server& server, MyJDClient& client) {
    using httplib::Request;
    using httplib::Response;
    const std::string api = Prefix;

    server.Get("/", [](const Request&, Response& res) { send(res, index()); });
    server.Get(api + "/health", [&client](const Request&, Response& res) { send(res, health(client)); });
    server.Post(api + "/connect", [&client](const Request&, Response& res) { send(res, connect(client)); });
    server.Post(api + "/disconnect", [&client](const Request&, Response& res) { send(res, disconnect(client)); });
    server.Post(api + "/downloads",
                [&client](const Request& req, Response& res) { send(res, add_download(client, req.body)); });
    server.Get(api + "/downloads", [&client](const Request&, Response& res) { send(res, get_downloads(client)); });
    server.Post(api + "/downloads/start",
                [&client](const Request& req, Response& res) { send(res, start_downloads(client, req.body)); });
    server.Post(api + "/downloads/pause",
                [&client](const Request& req, Response& res) { send(res, pause_downloads(client, req.body)); });
    server.Get(api + "/linkgrabber", [&client](const Request&, Response& res) { send(res, get_linkgrabber(client)); });
    server.Get(api + "/config", [&client](const Request&, Response& res) { send(res, get_config(client)); });
}
}  // namespace Routes
