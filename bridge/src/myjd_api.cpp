#include "myjd_api.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>

#include "crypto.hpp"
#include "error.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace {
constexpr int ApiVersion = 1;
constexpr const char* DeviceContentType = "application/aesjson-jd; charset=utf-8";

// Percent-encode everything but unreserved characters and '/'.
std::string quote(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

std::string secret_for(const std::string& email, const std::string& password, const std::string& domain) {
    return Crypto::sha256(Utils::to_lower(email) + password + domain);
}

httplib::Client make_client(const std::string& api_url, int timeout_seconds) {
    httplib::Client client(api_url);
    client.set_connection_timeout(timeout_seconds, 0);
    client.set_read_timeout(timeout_seconds, 0);
    client.set_write_timeout(timeout_seconds, 0);
    return client;
}

// Parameters are sent as a JSON array whose objects and booleans are pre-serialized strings.
json encode_params(const json& params) {
    json out = json::array();
    for (const auto& p : params) {
        if (p.is_object() || p.is_boolean()) {
            out.push_back(p.dump());
        } else {
            out.push_back(p);
        }
    }
    return out;
}

json package_ids_to_json(const std::vector<std::string>& package_ids) {
    json ids = json::array();
    for (const auto& id : package_ids) {
        try {
            size_t consumed = 0;
            const long long value = std::stoll(id, &consumed);
            if (consumed != id.size()) throw std::invalid_argument(id);
            ids.push_back(value);
        } catch (const std::logic_error&) {
            throw Error::ApiError("CLIENT", "BAD_PARAMETERS", "Invalid package id: " + id);
        }
    }
    return ids;
}

std::vector<json> to_records(const json& data) {
    std::vector<json> records;
    if (data.is_array()) {
        records.assign(data.begin(), data.end());
    }
    return records;
}
}  // namespace

MyJDApi::MyJDApi(std::string api_url, std::string app_key, int timeout_seconds)
    : m_api_url(std::move(api_url)), m_app_key(std::move(app_key)), m_timeout_seconds(timeout_seconds) {}

int64_t MyJDApi::next_request_id() {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    m_request_id = std::max(now, m_request_id + 1);
    return m_request_id;
}

void MyJDApi::update_encryption_tokens() {
    const std::string session = Crypto::from_hex(m_session_token);
    const std::string& previous = m_server_token.empty() ? m_login_secret : m_server_token;
    m_server_token = Crypto::sha256(previous + session);
    m_device_token = Crypto::sha256(m_device_secret + session);
}

void MyJDApi::raise_api_error(int status, const std::string& body, const std::string& key,
                              std::string_view path) const {
    json error = json::parse(body, nullptr, false);
    if (error.is_discarded() && !key.empty()) {
        try {
            error = json::parse(Crypto::decrypt(key, body), nullptr, false);
        } catch (const std::exception& e) {
            Log::debug(std::string("Could not decrypt error body: ") + e.what());
        }
    }
    std::string source = "MYJD";
    std::string type = "UNKNOWN";
    if (error.is_object()) {
        source = error.value("src", source);
        type = error.value("type", type);
    }
    const std::string message = "Server returned " + std::to_string(status) + " (" + source + "/" + type +
                                ") for " + std::string(path);
    if (type == "TOKEN_INVALID") throw Error::TokenInvalidError(source);
    throw Error::ApiError(source, type, message);
}

json MyJDApi::request_server(std::string_view path, const Query& params) {
    const int64_t rid = next_request_id();
    std::string key;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        key = m_server_token.empty() ? m_login_secret : m_server_token;
    }

    std::string query = std::string(path) + "?";
    for (const auto& [name, value] : params) {
        query += name + "=" + quote(value) + "&";
    }
    query += "rid=" + std::to_string(rid);
    query += "&signature=" + Crypto::to_hex(Crypto::hmac_sha256(key, query));

    auto client = make_client(m_api_url, m_timeout_seconds);
    auto res = client.Get(query);
    if (!res) {
        throw Error::ApiError("MYJD", "TRANSPORT", "Request to " + std::string(path) + " failed: " +
                                                       httplib::to_string(res.error()));
    }
    if (res->status != httplib::StatusCode::OK_200) {
        raise_api_error(res->status, res->body, key, path);
    }

    json reply = json::parse(Crypto::decrypt(key, res->body));
    if (reply.value("rid", int64_t{-1}) != rid) {
        throw Error::ApiError("MYJD", "BAD_RESPONSE", "Request id mismatch on " + std::string(path));
    }
    return reply;
}

void MyJDApi::connect(const Credentials& credentials) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_login_secret = secret_for(credentials.username, credentials.password, "server");
        m_device_secret = secret_for(credentials.username, credentials.password, "device");
        m_server_token.clear();
        m_device_token.clear();
        m_session_token.clear();
        m_regain_token.clear();
    }
    const std::string app_key = credentials.app_key.empty() ? m_app_key : credentials.app_key;
    json reply = request_server(Api::Connect, {{"email", credentials.username}, {"appkey", app_key}});

    std::lock_guard<std::mutex> lock(m_mutex);
    m_session_token = reply.at("sessiontoken").get<std::string>();
    m_regain_token = reply.at("regaintoken").get<std::string>();
    update_encryption_tokens();
}

void MyJDApi::reconnect() {
    std::string session;
    std::string regain;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        session = m_session_token;
        regain = m_regain_token;
    }
    if (session.empty()) {
        throw Error::ApiError("CLIENT", "NOT_CONNECTED", "No session to reconnect");
    }
    json reply = request_server(Api::Reconnect, {{"sessiontoken", session}, {"regaintoken", regain}});

    std::lock_guard<std::mutex> lock(m_mutex);
    m_session_token = reply.at("sessiontoken").get<std::string>();
    m_regain_token = reply.at("regaintoken").get<std::string>();
    update_encryption_tokens();
}

void MyJDApi::disconnect() {
    std::string session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        session = m_session_token;
    }
    auto forget_tokens = [this] {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_server_token.clear();
        m_device_token.clear();
        m_session_token.clear();
        m_regain_token.clear();
    };
    try {
        if (!session.empty()) request_server(Api::Disconnect, {{"sessiontoken", session}});
    } catch (const std::exception&) {
        forget_tokens();
        throw;
    }
    forget_tokens();
}

std::vector<json> MyJDApi::list_devices() {
    std::string session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        session = m_session_token;
    }
    json reply = request_server(Api::ListDevices, {{"sessiontoken", session}});
    return to_records(reply.value("list", json::array()));
}

std::shared_ptr<Device> MyJDApi::resolve_device(const std::string& device_id) {
    for (const auto& device : list_devices()) {
        if (device.value("id", "") == device_id) {
            Log::debug("Resolved device " + device_id + " (" + device.value("name", "") + ")");
            return std::make_shared<MyJDDevice>(shared_from_this(), device_id, device.value("name", ""));
        }
    }
    return nullptr;
}

json MyJDApi::device_action(const std::string& device_id, std::string_view path, const json& params) {
    const int64_t rid = next_request_id();
    std::string session;
    std::string key;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        session = m_session_token;
        key = m_device_token;
    }
    if (key.empty()) {
        throw Error::ApiError("CLIENT", "NOT_CONNECTED", "No session for device call " + std::string(path));
    }

    json payload = {{"url", std::string(path)}, {"params", encode_params(params)}, {"rid", rid}, {"apiVer", ApiVersion}};
    const std::string url = "/t_" + quote(session) + "_" + quote(device_id) + std::string(path);

    auto client = make_client(m_api_url, m_timeout_seconds);
    auto res = client.Post(url, Crypto::encrypt(key, payload.dump()), DeviceContentType);
    if (!res) {
        throw Error::ApiError("DEVICE", "TRANSPORT", "Request to " + std::string(path) + " failed: " +
                                                         httplib::to_string(res.error()));
    }
    if (res->status != httplib::StatusCode::OK_200) {
        raise_api_error(res->status, res->body, key, path);
    }

    json reply = json::parse(Crypto::decrypt(key, res->body));
    if (reply.value("rid", int64_t{-1}) != rid) {
        throw Error::ApiError("DEVICE", "BAD_RESPONSE", "Request id mismatch on " + std::string(path));
    }
    return reply.value("data", json());
}

MyJDDevice::MyJDDevice(std::shared_ptr<MyJDApi> api, std::string id, std::string name)
    : m_api(std::move(api)), m_id(std::move(id)), m_name(std::move(name)) {}

void MyJDDevice::submit_links(const LinkPackage& package) {
    json link = {{"autostart", package.auto_start},
                 {"links", package.links},
                 {"packageName", package.package_name},
                 {"destinationFolder", package.destination_folder},
                 {"overwritePackagizerRules", false},
                 {"priority", "DEFAULT"}};
    m_api->device_action(m_id, Api::AddLinks, json::array({link}));
}

std::vector<json> MyJDDevice::query_downloads() {
    json query = {{"bytesLoaded", true}, {"bytesTotal", true}, {"comment", false}, {"enabled", true},
                  {"eta", true},         {"priority", false},  {"finished", true}, {"running", true},
                  {"speed", true},       {"status", true},     {"childCount", true}, {"hosts", true},
                  {"saveTo", true},      {"maxResults", -1},   {"startAt", 0}};
    return to_records(m_api->device_action(m_id, Api::QueryDownloads, json::array({query})));
}

std::vector<json> MyJDDevice::query_pending_links() {
    json query = {{"bytesTotal", true}, {"childCount", true}, {"comment", true},     {"enabled", true},
                  {"hosts", true},      {"maxResults", -1},   {"packageUUIDs", json::array()},
                  {"priority", true},   {"saveTo", true},     {"startAt", 0},        {"status", true}};
    return to_records(m_api->device_action(m_id, Api::QueryLinkgrabber, json::array({query})));
}

void MyJDDevice::start_all() { m_api->device_action(m_id, Api::Start); }

void MyJDDevice::pause_all() { m_api->device_action(m_id, Api::Pause, json::array({true})); }

void MyJDDevice::start_packages(const std::vector<std::string>& package_ids) {
    m_api->device_action(m_id, Api::ForceDownload, json::array({json::array(), package_ids_to_json(package_ids)}));
}

void MyJDDevice::pause_packages(const std::vector<std::string>& package_ids) {
    m_api->device_action(m_id, Api::SetEnabled,
                         json::array({false, json::array(), package_ids_to_json(package_ids)}));
}
