// ─────────────────────────────────────────────────────────────────────────────
// MyJDClient Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch.hpp>

#include <memory>

#include "client.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "mocks/fake_session.hpp"

using Fake::FakeRemoteSession;

namespace {
struct Fixture {
    CONFIG config = Fake::config();
    std::shared_ptr<FakeRemoteSession> remote = std::make_shared<FakeRemoteSession>();
    Connection connection{remote, config.credentials};
    MyJDClient client{connection, config};
};
}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// add_download_package
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("add_download_package submits a package into the category folder", "[client][add]") {
    Fixture f;
    const auto result = f.client.add_download_package("Show S01", {"http://a/1", "http://a/2"}, "tv_show", false);

    REQUIRE(result.success);
    REQUIRE(result.error == ErrorKind::None);
    REQUIRE(result.message.find("Show S01") != std::string::npos);
    REQUIRE(f.remote->connect_calls == 1);

    REQUIRE(f.remote->device->submitted.size() == 1);
    const LinkPackage& sent = f.remote->device->submitted[0];
    REQUIRE(sent.package_name == "Show S01");
    REQUIRE(sent.links == "http://a/1\nhttp://a/2");
    REQUIRE(sent.destination_folder == "/downloads/tv_show");
    REQUIRE_FALSE(sent.auto_start);
}

TEST_CASE("add_download_package rejects an empty link list softly", "[client][add][validation]") {
    Fixture f;
    OperationResult result;
    REQUIRE_NOTHROW(result = f.client.add_download_package("Movie", {}, "movie"));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ErrorKind::Validation);
    REQUIRE(result.message == "No download links provided");
    REQUIRE(f.remote->device->calls == 0);
}

TEST_CASE("add_download_package rejects categories outside the allowed set", "[client][add][validation]") {
    Fixture f;
    const auto result = f.client.add_download_package("Scary", {"http://a/1"}, "horror");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ErrorKind::Validation);
    REQUIRE(result.message.find("Invalid category") != std::string::npos);
    REQUIRE(result.message.find("tv_show, movie") != std::string::npos);
    REQUIRE(f.remote->device->submitted.empty());
}

TEST_CASE("add_download_package rejects a blank name", "[client][add][validation]") {
    Fixture f;
    const auto result = f.client.add_download_package("   ", {"http://a/1"}, "movie");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ErrorKind::Validation);
}

TEST_CASE("add_download_package reports a failed login as a result", "[client][add]") {
    Fixture f;
    f.remote->reject_login = true;
    OperationResult result;
    REQUIRE_NOTHROW(result = f.client.add_download_package("Movie", {"http://a/1"}, "movie"));
    REQUIRE_FALSE(result.success);
    REQUIRE(result.error == ErrorKind::Connection);
}

TEST_CASE("add_download_package throws when the device refuses the package", "[client][add]") {
    Fixture f;
    f.remote->device->fail_with_type = "BAD_PARAMETERS";
    REQUIRE_THROWS_AS(f.client.add_download_package("Movie", {"http://a/1"}, "movie"), Error::OperationError);
}

TEST_CASE("add_download_package survives one expired token", "[client][add]") {
    Fixture f;
    f.connection.connect();
    f.remote->device->token_failures = 1;

    const auto result = f.client.add_download_package(DownloadRequest{"Movie", {"http://a/1"}, "movie", true});
    REQUIRE(result.success);
    REQUIRE(f.remote->reconnect_calls == 1);
    REQUIRE(f.remote->device->submitted.size() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("get_download_packages maps raw records", "[client][query]") {
    Fixture f;
    f.remote->device->downloads = {
        json{{"name", "Show"}, {"bytesTotal", 1000}, {"bytesLoaded", 250}, {"status", "downloading"}, {"uuid", 1700}},
        json{{"name", "Empty"}, {"bytesTotal", 0}, {"bytesLoaded", 0}, {"status", "Finished"}},
    };

    const auto packages = f.client.get_download_packages();
    REQUIRE(packages.size() == 2);

    REQUIRE(packages[0].progress_percentage() == Approx(25.0));
    REQUIRE(packages[0].is_downloading());
    REQUIRE_FALSE(packages[0].is_completed());
    REQUIRE(packages[0].package_id == "1700");

    REQUIRE(packages[1].progress_percentage() == 0.0);
    REQUIRE(packages[1].is_completed());
}

TEST_CASE("get_download_packages rebuilds the list on every call", "[client][query]") {
    Fixture f;
    f.remote->device->downloads = {json{{"name", "One"}}};
    REQUIRE(f.client.get_download_packages().size() == 1);

    f.remote->device->downloads.push_back(json{{"name", "Two"}});
    REQUIRE(f.client.get_download_packages().size() == 2);
    REQUIRE(f.remote->device->calls == 2);
}

TEST_CASE("Queries connect lazily", "[client][query]") {
    Fixture f;
    REQUIRE_FALSE(f.connection.is_connected());
    f.client.get_linkgrabber_packages();
    REQUIRE(f.connection.is_connected());
    REQUIRE(f.remote->connect_calls == 1);
}

TEST_CASE("Queries surface a failed login as ConnectionError", "[client][query]") {
    Fixture f;
    f.remote->reject_login = true;
    REQUIRE_THROWS_AS(f.client.get_download_packages(), Error::ConnectionError);
    REQUIRE_THROWS_AS(f.client.get_linkgrabber_packages(), Error::ConnectionError);
}

TEST_CASE("Queries turn remote failures into OperationError", "[client][query]") {
    Fixture f;
    f.remote->device->fail_with_type = "TRANSPORT";
    REQUIRE_THROWS_AS(f.client.get_download_packages(), Error::OperationError);
    REQUIRE_THROWS_AS(f.client.get_linkgrabber_packages(), Error::OperationError);
}

TEST_CASE("get_linkgrabber_packages passes records through", "[client][query]") {
    Fixture f;
    f.remote->device->pending = {json{{"name", "Pending"}, {"childCount", 3}}};
    const auto records = f.client.get_linkgrabber_packages();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0]["childCount"] == 3);
}

// ═══════════════════════════════════════════════════════════════════════════
// Start / pause
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("start_downloads without ids starts everything", "[client][control]") {
    Fixture f;
    REQUIRE(f.client.start_downloads());
    REQUIRE(f.client.start_downloads(std::vector<std::string>{}));
    REQUIRE(f.remote->device->start_all_calls == 2);
    REQUIRE(f.remote->device->started_ids.empty());
}

TEST_CASE("start_downloads with ids targets those packages", "[client][control]") {
    Fixture f;
    REQUIRE(f.client.start_downloads(std::vector<std::string>{"11", "12"}));
    REQUIRE(f.remote->device->start_all_calls == 0);
    REQUIRE(f.remote->device->started_ids == std::vector<std::string>{"11", "12"});
}

TEST_CASE("pause_downloads without ids pauses everything", "[client][control]") {
    Fixture f;
    REQUIRE(f.client.pause_downloads());
    REQUIRE(f.remote->device->pause_all_calls == 1);
}

TEST_CASE("pause_downloads with ids targets those packages", "[client][control]") {
    Fixture f;
    REQUIRE(f.client.pause_downloads(std::vector<std::string>{"7"}));
    REQUIRE(f.remote->device->pause_all_calls == 0);
    REQUIRE(f.remote->device->paused_ids == std::vector<std::string>{"7"});
}

TEST_CASE("start and pause fail with OperationError on remote errors", "[client][control]") {
    Fixture f;
    f.remote->device->fail_with_type = "INTERNAL_SERVER_ERROR";
    REQUIRE_THROWS_AS(f.client.start_downloads(), Error::OperationError);
    REQUIRE_THROWS_AS(f.client.pause_downloads(), Error::OperationError);
}
