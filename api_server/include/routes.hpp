#pragma once

#include <string>

#include "client.hpp"
#include "types.h"

namespace httplib {
class Server;
}

namespace Routes {
inline constexpr const char* Prefix = "/api";
inline constexpr const char* Version = "1.0.0";

struct Reply {
    int status = 200;
    json body;
};

// One handler per endpoint. They never throw: every failure is turned into a JSON reply.
Reply index();
Reply health(MyJDClient& client);
Reply connect(MyJDClient& client);
Reply disconnect(MyJDClient& client);
Reply add_download(MyJDClient& client, const std::string& request_body);
Reply get_downloads(MyJDClient& client);
Reply start_downloads(MyJDClient& client, const std::string& request_body);
Reply pause_downloads(MyJDClient& client, const std::string& request_body);
Reply get_linkgrabber(MyJDClient& client);
Reply get_config(MyJDClient& client);

Reply error_reply(int status, const std::string& error, const std::string& message);

void register_routes(httplib::Server& server, MyJDClient& client);
}  // namespace Routes
