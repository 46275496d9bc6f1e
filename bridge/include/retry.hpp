#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "connection.hpp"
#include "error.hpp"
#include "log.hpp"
#include "session.hpp"

namespace Retry {
// Run `op(Device&)` against the current device. A rejected token gets exactly one
// refresh + second attempt; a second rejection, or a failed refresh, ends as
// Error::OperationError. Other errors pass through untouched.
template <typename Op>
auto run(Connection& connection, const std::string& what, Op&& op) -> std::invoke_result_t<Op&, Device&> {
    uint64_t generation = 0;
    std::shared_ptr<Device> device = connection.device(&generation);
    try {
        return op(*device);
    } catch (const Error::TokenInvalidError& first) {
        Log::warn(what + ": session token rejected, refreshing connection");
        if (!connection.refresh_connection(generation)) {
            throw Error::OperationError(what + " failed: " + first.what());
        }
        device = connection.device(&generation);
        try {
            return op(*device);
        } catch (const Error::TokenInvalidError&) {
            Log::error(what + ": session token rejected again after reconnect");
            connection.invalidate(generation);
            throw Error::OperationError(what + " failed: " + first.what());
        }
    }
}
}  // namespace Retry
