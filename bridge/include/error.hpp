#pragma once

#include <stdexcept>
#include <string>

namespace Error {
class BridgeError : public std::runtime_error {
   public:
    explicit BridgeError(const std::string& message) : std::runtime_error(message) {}
};

// Authentication or device lookup failed, or the session is not usable.
class ConnectionError : public BridgeError {
   public:
    using BridgeError::BridgeError;
};

// A remote call failed for good (non-token error, or token error after the one retry).
class OperationError : public BridgeError {
   public:
    using BridgeError::BridgeError;
};

class ValidationError : public BridgeError {
   public:
    using BridgeError::BridgeError;
};

class ConfigurationError : public BridgeError {
   public:
    using BridgeError::BridgeError;
};

// Raised by the session capability when the remote side rejects a call.
class ApiError : public BridgeError {
   public:
    ApiError(const std::string& source, const std::string& type, const std::string& message)
        : BridgeError(message), m_source(source), m_type(type) {}

    const std::string& source() const { return m_source; }
    const std::string& type() const { return m_type; }

   private:
    std::string m_source;
    std::string m_type;
};

// Session token expired or revoked. Only the retry executor should ever catch this.
class TokenInvalidError : public ApiError {
   public:
    explicit TokenInvalidError(const std::string& source)
        : ApiError(source, "TOKEN_INVALID", "Session token rejected by " + source) {}
};
}  // namespace Error
