#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "session.hpp"
#include "types.h"

enum class State { Disconnected, Connected };

// Owns the one live session against the remote service. Every lifecycle change
// (connect, disconnect, refresh, invalidate) runs under m_mutex, so concurrent callers
// that hit an expired token line up behind a single reconnect.
class Connection {
   public:
    Connection(std::shared_ptr<RemoteSession> remote, Credentials credentials);

    // Log in and resolve the configured device. No-op when already connected.
    // Throws Error::ConnectionError.
    void connect();
    // Never throws. The session is gone afterwards even if the remote call failed.
    void disconnect();
    bool is_connected() const;

    // Token renewal first, full login as fallback. Never throws.
    bool refresh_connection();
    // Same, but only when the session is still the one seen at `seen_generation`.
    // If another caller got there first, its outcome is reused: true when it
    // reconnected, false when it dropped the session.
    bool refresh_connection(uint64_t seen_generation);

    // Drop the session after a token failure that could not be recovered.
    // No-op when the session was replaced since `seen_generation`.
    void invalidate(uint64_t seen_generation);

    // Current device handle and the generation it belongs to.
    // Throws Error::ConnectionError when not connected.
    std::shared_ptr<Device> device(uint64_t* generation = nullptr) const;

    uint64_t generation() const;
    const std::string& device_id() const { return m_credentials.device_id; }

   private:
    void connect_locked();
    bool refresh_locked();
    void clear_locked();

   private:
    std::shared_ptr<RemoteSession> m_remote;
    const Credentials m_credentials;

    mutable std::mutex m_mutex;
    State m_state = State::Disconnected;
    bool m_authenticated = false;
    std::shared_ptr<Device> m_device;
    // bumped on every connect, refresh and clear
    uint64_t m_generation = 0;
};
