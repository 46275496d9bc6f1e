#include <catch2/catch.hpp>

#include <type_traits>

#include "types.h"
#include "utils.hpp"

TEST_CASE("Status strings parse case-insensitively", "[package]") {
    REQUIRE(status_from_string("downloading") == DownloadStatus::Downloading);
    REQUIRE(status_from_string("FINISHED") == DownloadStatus::Finished);
    REQUIRE(status_from_string("Extracting") == DownloadStatus::Extracting);
    REQUIRE(status_from_string("queued") == DownloadStatus::Unknown);
    REQUIRE(status_from_string("") == DownloadStatus::Unknown);
    REQUIRE(to_string(DownloadStatus::Paused) == "paused");
}

TEST_CASE("Raw records fall back to defaults", "[package]") {
    const DownloadPackage p = DownloadPackage::from_record(json::object());
    REQUIRE(p.name == "Unknown");
    REQUIRE(p.bytes_total == 0);
    REQUIRE(p.bytes_loaded == 0);
    REQUIRE(p.status == DownloadStatus::Unknown);
    REQUIRE(p.package_id.empty());
    REQUIRE(p.eta == -1);
    REQUIRE(p.speed == 0);
    REQUIRE(p.progress_percentage() == 0.0);
}

TEST_CASE("Package JSON carries the derived fields", "[package]") {
    const DownloadPackage p = DownloadPackage::from_record(
        {{"name", "Movie"}, {"bytesTotal", 2048}, {"bytesLoaded", 2048}, {"status", "finished"}, {"uuid", "abc"},
         {"eta", 0}, {"speed", 1536}});
    const json j = p.to_json();
    REQUIRE(j["name"] == "Movie");
    REQUIRE(j["package_id"] == "abc");
    REQUIRE(j["status"] == "finished");
    REQUIRE(j["progress_percentage"].get<double>() == Approx(100.0));
    REQUIRE(j["formatted_size"] == "2.0 KB");
    REQUIRE(j["formatted_speed"] == "1.5 KB/s");
    REQUIRE(j["is_completed"] == true);
    REQUIRE(j["is_downloading"] == false);
}

TEST_CASE("Byte counts are formatted for humans", "[utils]") {
    REQUIRE(Utils::format_bytes(0) == "0 B");
    REQUIRE(Utils::format_bytes(512) == "512.0 B");
    REQUIRE(Utils::format_bytes(1024) == "1.0 KB");
    REQUIRE(Utils::format_bytes(5LL * 1024 * 1024 * 1024) == "5.0 GB");
    REQUIRE(Utils::format_bytes(3LL * 1024 * 1024 * 1024 * 1024 * 1024) == "3072.0 TB");

    DownloadPackage idle;
    REQUIRE(idle.formatted_speed() == "0 B/s");
}

TEST_CASE("Season markers are normalized in package names", "[utils]") {
    REQUIRE(Utils::clean_name("Show Stagione 3") == "Show S03");
    REQUIRE(Utils::clean_name("show stagione-12 ITA") == "show S12 ITA");
    REQUIRE(Utils::clean_name("STAGIONE_1 e Stagione: 2") == "S01 e S02");
    REQUIRE(Utils::clean_name("Plain name") == "Plain name");
}

TEST_CASE("Category aliases map to configured categories", "[utils]") {
    const std::map<std::string, std::vector<std::string>> mapping{{"tv_show", {"serie", "tv"}}, {"movie", {"film"}}};
    REQUIRE(Utils::map_category("Serie", mapping) == "tv_show");
    REQUIRE(Utils::map_category("film", mapping) == "movie");
    REQUIRE(Utils::map_category("movie", mapping) == "movie");
    REQUIRE(Utils::map_category("horror", mapping) == "horror");
}

TEST_CASE("Destination folder joins base path and category", "[utils]") {
    REQUIRE(Utils::destination_folder("/downloads", "movie") == "/downloads/movie");
    REQUIRE(Utils::destination_folder("/downloads/", "tv_show") == "/downloads/tv_show");
}

TEST_CASE("Packages are plain value snapshots", "[package]") {
    STATIC_REQUIRE(std::is_aggregate<DownloadPackage>::value);

    const DownloadPackage p = DownloadPackage::from_record({{"name", "Show"}, {"bytesTotal", 10}});
    DownloadPackage copy = p;
    copy.bytes_loaded = 10;
    REQUIRE(p.bytes_loaded == 0);
    REQUIRE(copy.progress_percentage() == Approx(100.0));
}
