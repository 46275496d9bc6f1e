#pragma once

#include <memory>
#include <string>
#include <vector>

#include "types.h"

// Remote side of the bridge. The controller only ever talks to these two interfaces,
// the wire protocol lives in the implementation (see myjd_api.hpp).
//
// Implementations report a rejected session token with Error::TokenInvalidError and every
// other remote failure with Error::ApiError.

class Device {
   public:
    virtual ~Device() = default;

    virtual const std::string& id() const = 0;

    virtual void submit_links(const LinkPackage& package) = 0;
    virtual std::vector<json> query_downloads() = 0;
    virtual std::vector<json> query_pending_links() = 0;

    virtual void start_all() = 0;
    virtual void pause_all() = 0;
    virtual void start_packages(const std::vector<std::string>& package_ids) = 0;
    virtual void pause_packages(const std::vector<std::string>& package_ids) = 0;
};

class RemoteSession {
   public:
    virtual ~RemoteSession() = default;

    // Full login. Throws Error::ApiError when the account rejects the credentials.
    virtual void connect(const Credentials& credentials) = 0;
    // Renew the session token of an existing login.
    virtual void reconnect() = 0;
    virtual void disconnect() = 0;
    // nullptr when the account has no device with that id.
    virtual std::shared_ptr<Device> resolve_device(const std::string& device_id) = 0;
};
