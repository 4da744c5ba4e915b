// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/config.hpp>
#include <reel/core/http_session.hpp>
#include <reel/disk/error.hpp>
#include "test_support.hpp"

using namespace reel::core;
using namespace reel::test;

TEST_CASE("EngineConfig defaults", "[config]") {
    EngineConfig config;
    CHECK(config.concurrency_cap == DEFAULT_CONCURRENCY_CAP);
    CHECK(config.per_item_cap == 0);
    CHECK(config.progress_report_count == PROGRESS_REPORT_COUNT);
    CHECK(config.buffer_size == READ_BUFFER_SIZE);
    CHECK(config.catalog_path == DEFAULT_CATALOG_PATH);
    CHECK_FALSE(config.validate());
}

TEST_CASE("EngineConfig::parse", "[config]") {
    SECTION("Present keys override, absent keys keep defaults") {
        auto config = EngineConfig::parse(R"({"concurrency_cap": 6, "per_item_cap": 2,
                                              "catalog_path": "/var/lib/reel/catalog.json"})");
        REQUIRE(config.has_value());
        CHECK(config->concurrency_cap == 6);
        CHECK(config->per_item_cap == 2);
        CHECK(config->catalog_path == "/var/lib/reel/catalog.json");
        CHECK(config->progress_report_count == PROGRESS_REPORT_COUNT);
        CHECK(config->user_agent == DEFAULT_USER_AGENT);
    }

    SECTION("Invalid documents") {
        CHECK(EngineConfig::parse("not json").error() == TransferErrc::invalid_config);
        CHECK(EngineConfig::parse("[1, 2]").error() == TransferErrc::invalid_config);
        CHECK(EngineConfig::parse(R"({"concurrency_cap": "four"})").error() == TransferErrc::invalid_config);
    }

    SECTION("Values that fail validation") {
        CHECK(EngineConfig::parse(R"({"concurrency_cap": 0})").error() == TransferErrc::invalid_config);
        CHECK(EngineConfig::parse(R"({"progress_report_count": 0})").error() == TransferErrc::invalid_config);
        CHECK(EngineConfig::parse(R"({"catalog_path": ""})").error() == TransferErrc::invalid_config);
    }
}

TEST_CASE("EngineConfig::load", "[config]") {
    TempDir dir;

    SECTION("From a file") {
        write_file(dir.file("reel.json"), R"({"progress_report_count": 5, "read_timeout_sec": 30})");
        auto config = EngineConfig::load(dir.file("reel.json"));
        REQUIRE(config.has_value());
        CHECK(config->progress_report_count == 5);
        CHECK(config->read_timeout_sec == 30);
    }

    SECTION("Missing file") {
        CHECK(EngineConfig::load(dir.file("absent.json")).error() == reel::disk::DiskErrc::file_not_found);
    }
}

TEST_CASE("HttpOptions::from copies the transport settings", "[config]") {
    EngineConfig config;
    config.connect_timeout_sec = 3;
    config.read_timeout_sec = 7;
    config.max_redirects = 2;
    config.buffer_size = 4096;
    config.user_agent = "test-agent";

    auto options = HttpOptions::from(config);
    CHECK(options.connect_timeout_sec == 3);
    CHECK(options.read_timeout_sec == 7);
    CHECK(options.max_redirects == 2);
    CHECK(options.buffer_size == 4096);
    CHECK(options.user_agent == "test-agent");
}
