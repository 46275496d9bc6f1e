// ─────────────────────────────────────────────────────────────────────────────
// Connection Tests
// ─────────────────────────────────────────────────────────────────────────────
// Session lifecycle: login, device lookup, idempotent connect, best-effort
// disconnect, and the reconnect-then-login refresh path.

#include <catch2/catch.hpp>

#include <memory>

#include "connection.hpp"
#include "error.hpp"
#include "mocks/fake_session.hpp"

using Fake::FakeRemoteSession;

namespace {
std::pair<std::unique_ptr<Connection>, std::shared_ptr<FakeRemoteSession>> make_connection(
    Credentials credentials = Fake::credentials()) {
    auto remote = std::make_shared<FakeRemoteSession>();
    auto connection = std::make_unique<Connection>(remote, std::move(credentials));
    return {std::move(connection), remote};
}
}  // namespace

TEST_CASE("Connection starts disconnected", "[connection]") {
    auto [connection, remote] = make_connection();
    REQUIRE_FALSE(connection->is_connected());
    REQUIRE_THROWS_AS(connection->device(), Error::ConnectionError);
    REQUIRE(remote->connect_calls == 0);
}

TEST_CASE("Connection rejects bad credentials", "[connection]") {
    Credentials wrong = Fake::credentials();
    wrong.password = "not-the-password";
    auto [connection, remote] = make_connection(wrong);

    REQUIRE_THROWS_AS(connection->connect(), Error::ConnectionError);
    REQUIRE_FALSE(connection->is_connected());
    REQUIRE(remote->resolve_calls == 0);
}

TEST_CASE("Connection fails when the device id is unknown", "[connection]") {
    Credentials other = Fake::credentials();
    other.device_id = "device-404";
    auto [connection, remote] = make_connection(other);

    try {
        connection->connect();
        FAIL("connect() should have thrown");
    } catch (const Error::ConnectionError& e) {
        REQUIRE(std::string(e.what()).find("device-404") != std::string::npos);
    }
    REQUIRE_FALSE(connection->is_connected());
}

TEST_CASE("Connection connects once and stays connected", "[connection]") {
    auto [connection, remote] = make_connection();

    connection->connect();
    REQUIRE(connection->is_connected());
    REQUIRE(connection->device()->id() == "device-1");

    SECTION("connect while connected does not log in again") {
        connection->connect();
        connection->connect();
        REQUIRE(remote->connect_calls == 1);
        REQUIRE(connection->is_connected());
    }

    SECTION("disconnect clears the session") {
        connection->disconnect();
        REQUIRE_FALSE(connection->is_connected());
        REQUIRE(remote->disconnect_calls == 1);
    }

    SECTION("invalidate clears the session without calling the remote") {
        connection->invalidate(connection->generation());
        REQUIRE_FALSE(connection->is_connected());
        REQUIRE(remote->disconnect_calls == 0);
    }
}

TEST_CASE("Connection disconnect swallows transport failures", "[connection]") {
    auto [connection, remote] = make_connection();
    connection->connect();
    remote->fail_disconnect = true;

    REQUIRE_NOTHROW(connection->disconnect());
    REQUIRE_FALSE(connection->is_connected());
}

TEST_CASE("Connection disconnect when never connected is harmless", "[connection]") {
    auto [connection, remote] = make_connection();
    REQUIRE_NOTHROW(connection->disconnect());
    REQUIRE(remote->disconnect_calls == 0);
}

TEST_CASE("Connection refresh renews the token first", "[connection][refresh]") {
    auto [connection, remote] = make_connection();
    connection->connect();
    const uint64_t before = connection->generation();

    REQUIRE(connection->refresh_connection());
    REQUIRE(remote->reconnect_calls == 1);
    REQUIRE(remote->connect_calls == 1);
    REQUIRE(connection->is_connected());
    REQUIRE(connection->generation() != before);
}

TEST_CASE("Connection refresh falls back to a full login", "[connection][refresh]") {
    auto [connection, remote] = make_connection();
    connection->connect();
    remote->fail_reconnect = true;

    REQUIRE(connection->refresh_connection());
    REQUIRE(remote->reconnect_calls == 1);
    REQUIRE(remote->connect_calls == 2);
    REQUIRE(connection->is_connected());
}

TEST_CASE("Connection refresh reports failure without throwing", "[connection][refresh]") {
    auto [connection, remote] = make_connection();
    connection->connect();
    remote->fail_reconnect = true;
    remote->reject_login = true;

    bool refreshed = true;
    REQUIRE_NOTHROW(refreshed = connection->refresh_connection());
    REQUIRE_FALSE(refreshed);
    REQUIRE_FALSE(connection->is_connected());
}

TEST_CASE("Connection refresh skips work already done by another caller", "[connection][refresh]") {
    auto [connection, remote] = make_connection();
    connection->connect();
    const uint64_t stale = connection->generation();

    REQUIRE(connection->refresh_connection(stale));
    REQUIRE(remote->reconnect_calls == 1);

    // Second caller observed the same stale generation before the first refresh landed.
    REQUIRE(connection->refresh_connection(stale));
    REQUIRE(remote->reconnect_calls == 1);
    REQUIRE(remote->connect_calls == 1);
}

TEST_CASE("Connection refresh does not log in again after another caller failed", "[connection][refresh]") {
    auto [connection, remote] = make_connection();
    connection->connect();
    const uint64_t seen = connection->generation();
    remote->fail_reconnect = true;
    remote->reject_login = true;

    REQUIRE_FALSE(connection->refresh_connection(seen));
    REQUIRE(remote->connect_calls == 2);

    // A second caller queued with the same generation reuses that outcome.
    REQUIRE_FALSE(connection->refresh_connection(seen));
    REQUIRE(remote->reconnect_calls == 1);
    REQUIRE(remote->connect_calls == 2);
}

TEST_CASE("Connection invalidate ignores a session it did not see", "[connection]") {
    auto [connection, remote] = make_connection();
    connection->connect();
    const uint64_t stale = connection->generation();
    REQUIRE(connection->refresh_connection());

    connection->invalidate(stale);
    REQUIRE(connection->is_connected());

    connection->invalidate(connection->generation());
    REQUIRE_FALSE(connection->is_connected());
    REQUIRE(remote->disconnect_calls == 0);
}
