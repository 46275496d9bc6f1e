#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "session.hpp"
#include "types.h"

namespace Api {
inline constexpr std::string_view Connect = "/my/connect";
inline constexpr std::string_view Reconnect = "/my/reconnect";
inline constexpr std::string_view Disconnect = "/my/disconnect";
inline constexpr std::string_view ListDevices = "/my/listdevices";

inline constexpr std::string_view AddLinks = "/linkgrabberv2/addLinks";
inline constexpr std::string_view QueryLinkgrabber = "/linkgrabberv2/queryPackages";
inline constexpr std::string_view QueryDownloads = "/downloadsV2/queryPackages";
inline constexpr std::string_view ForceDownload = "/downloadsV2/forceDownload";
inline constexpr std::string_view SetEnabled = "/downloadsV2/setEnabled";
inline constexpr std::string_view Start = "/downloadcontroller/start";
inline constexpr std::string_view Pause = "/downloadcontroller/pause";
}  // namespace Api

// MyJDownloader cloud API (api.jdownloader.org). Requests are signed with HMAC-SHA256 and
// responses are AES-128-CBC encrypted with tokens derived from the account login and the
// current session token. Must be owned by a std::shared_ptr: the devices it hands out
// keep it alive.
class MyJDApi : public RemoteSession, public std::enable_shared_from_this<MyJDApi> {
   public:
    MyJDApi(std::string api_url, std::string app_key, int timeout_seconds = 30);

    void connect(const Credentials& credentials) override;
    void reconnect() override;
    void disconnect() override;
    std::shared_ptr<Device> resolve_device(const std::string& device_id) override;

    std::vector<json> list_devices();
    // Call `path` on a device and return the "data" member of the reply.
    json device_action(const std::string& device_id, std::string_view path, const json& params = json::array());

   private:
    using Query = std::vector<std::pair<std::string, std::string>>;

    json request_server(std::string_view path, const Query& params);
    void update_encryption_tokens();
    int64_t next_request_id();
    [[noreturn]] void raise_api_error(int status, const std::string& body, const std::string& key,
                                      std::string_view path) const;

   private:
    std::string m_api_url;
    std::string m_app_key;
    int m_timeout_seconds;

    mutable std::mutex m_mutex;
    std::string m_login_secret;
    std::string m_device_secret;
    std::string m_server_token;
    std::string m_device_token;
    std::string m_session_token;
    std::string m_regain_token;
    int64_t m_request_id = 0;
};

class MyJDDevice : public Device {
   public:
    MyJDDevice(std::shared_ptr<MyJDApi> api, std::string id, std::string name);

    const std::string& id() const override { return m_id; }
    const std::string& name() const { return m_name; }

    void submit_links(const LinkPackage& package) override;
    std::vector<json> query_downloads() override;
    std::vector<json> query_pending_links() override;

    void start_all() override;
    void pause_all() override;
    void start_packages(const std::vector<std::string>& package_ids) override;
    void pause_packages(const std::vector<std::string>& package_ids) override;

   private:
    std::shared_ptr<MyJDApi> m_api;
    std::string m_id;
    std::string m_name;
};
