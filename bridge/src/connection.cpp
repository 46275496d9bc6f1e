#include "connection.hpp"

#include <utility>

#include "error.hpp"
#include "log.hpp"

Connection::Connection(std::shared_ptr<RemoteSession> remote, Credentials credentials)
    : m_remote(std::move(remote)), m_credentials(std::move(credentials)) {}

void Connection::connect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == State::Connected) return;
    connect_locked();
}

void Connection::connect_locked() {
    try {
        m_remote->connect(m_credentials);
        m_authenticated = true;
        auto device = m_remote->resolve_device(m_credentials.device_id);
        if (!device) {
            throw Error::ConnectionError("Device with ID " + m_credentials.device_id + " not found");
        }
        m_device = std::move(device);
        m_state = State::Connected;
        ++m_generation;
        Log::info("Successfully connected to MyJDownloader");
    } catch (const Error::ConnectionError& e) {
        clear_locked();
        Log::error(std::string("Failed to connect to MyJDownloader: ") + e.what());
        throw;
    } catch (const std::exception& e) {
        clear_locked();
        Log::error(std::string("Failed to connect to MyJDownloader: ") + e.what());
        throw Error::ConnectionError(std::string("Connection failed: ") + e.what());
    }
}

void Connection::disconnect() {
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        if (m_authenticated) m_remote->disconnect();
        Log::info("Disconnected from MyJDownloader");
    } catch (const std::exception& e) {
        Log::error(std::string("Error during disconnection: ") + e.what());
    }
    clear_locked();
}

bool Connection::is_connected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_authenticated && m_device != nullptr;
}

bool Connection::refresh_connection() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return refresh_locked();
}

bool Connection::refresh_connection(uint64_t seen_generation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_generation != seen_generation) {
        if (m_state == State::Connected) {
            Log::debug("Session already refreshed by another caller");
            return true;
        }
        // The refresh we queued behind failed; another login now would only be refused again.
        Log::debug("Session already dropped by another caller, not logging in again");
        return false;
    }
    return refresh_locked();
}

bool Connection::refresh_locked() {
    if (m_authenticated) {
        try {
            m_remote->reconnect();
            auto device = m_remote->resolve_device(m_credentials.device_id);
            if (device) {
                m_device = std::move(device);
                m_state = State::Connected;
                ++m_generation;
                Log::info("Session token renewed");
                return true;
            }
            Log::warn("Device " + m_credentials.device_id + " not found after reconnect");
        } catch (const std::exception& e) {
            Log::warn(std::string("Reconnect failed, falling back to full login: ") + e.what());
        }
    }

    clear_locked();
    try {
        connect_locked();
        return true;
    } catch (const Error::ConnectionError&) {
        // connect_locked already logged it
        return false;
    }
}

void Connection::invalidate(uint64_t seen_generation) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_generation != seen_generation) return;
    if (m_state == State::Connected) {
        Log::warn("Session invalidated after unrecovered token failure");
    }
    clear_locked();
}

std::shared_ptr<Device> Connection::device(uint64_t* generation) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_authenticated || !m_device) {
        throw Error::ConnectionError("Not connected to MyJDownloader");
    }
    if (generation) *generation = m_generation;
    return m_device;
}

uint64_t Connection::generation() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_generation;
}

void Connection::clear_locked() {
    ++m_generation;
    m_state = State::Disconnected;
    m_authenticated = false;
    m_device.reset();
}
