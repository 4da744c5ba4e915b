// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/cli/commands.hpp>
#include <reel/cli/progress_bar.hpp>
#include <reel/core/log.hpp>
#include "test_support.hpp"

using namespace reel::cli;
using namespace reel::test;

namespace {

CliArgs parse(std::vector<std::string> words) {
    std::vector<char*> argv;
    std::string program = "reel";
    argv.push_back(program.data());
    for (auto& w : words) {
        argv.push_back(w.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parse_args", "[cli]") {
    SECTION("URLs and options") {
        auto args = parse({"-d", "/music", "--item", "album-7", "-c", "4",
                           "https://cdn.example.com/1.mp3", "https://cdn.example.com/2.mp3", "-q"});
        CHECK(args.errors.empty());
        CHECK(args.output_dir == "/music");
        CHECK(args.item_id == "album-7");
        CHECK(args.concurrency == 4);
        CHECK(args.quiet);
        CHECK(args.urls == std::vector<std::string>{"https://cdn.example.com/1.mp3",
                                                    "https://cdn.example.com/2.mp3"});
    }

    SECTION("Help stops parsing") {
        auto args = parse({"--bogus", "-h", "--also-bogus"});
        CHECK(args.help);
        CHECK(args.errors.size() == 1);
    }

    SECTION("Errors are collected") {
        auto args = parse({"-c", "zero", "--frobnicate", "--catalog"});
        REQUIRE(args.errors.size() == 3);
        CHECK(args.errors[0] == "invalid concurrency: zero");
        CHECK(args.errors[1] == "unknown option: --frobnicate");
        CHECK(args.errors[2] == "--catalog needs a value");
    }

    SECTION("Resume mode") {
        auto args = parse({"--resume", "--catalog", "/var/lib/reel.json", "-V"});
        CHECK(args.resume);
        CHECK(args.verbose);
        CHECK(args.catalog_path == "/var/lib/reel.json");
        CHECK(args.urls.empty());
    }
}

TEST_CASE("load_config applies command line overrides", "[cli]") {
    TempDir dir;
    write_file(dir.file("reel.json"), R"({"concurrency_cap": 2, "per_item_cap": 1})");

    auto args = parse({"--config", dir.file("reel.json"), "-c", "5", "--catalog", dir.file("c.json")});
    auto config = load_config(args);
    REQUIRE(config.has_value());
    CHECK(config->concurrency_cap == 5);
    CHECK(config->per_item_cap == 1);
    CHECK(config->catalog_path == dir.file("c.json"));

    CHECK_FALSE(load_config(parse({"--config", dir.file("missing.json")})).has_value());
}

TEST_CASE("plan_resources names targets after the URLs", "[cli]") {
    const std::filesystem::path dir = "/music/album";

    SECTION("Distinct file names are kept") {
        auto planned = plan_resources({"https://cdn.example.com/a/01.mp3",
                                       "https://cdn.example.com/a/02.mp3"}, dir);
        REQUIRE(planned.has_value());
        REQUIRE(planned->size() == 2);
        CHECK((*planned)[0].target_path == (dir / "01.mp3").string());
        CHECK((*planned)[0].track_ref == "01.mp3");
        CHECK((*planned)[1].target_path == (dir / "02.mp3").string());
    }

    SECTION("A shared file name gets the position as prefix") {
        auto planned = plan_resources({"https://cdn.example.com/a/1.ts",
                                       "https://cdn.example.com/b/1.ts",
                                       "https://cdn.example.com/c/2.ts"}, dir);
        REQUIRE(planned.has_value());
        REQUIRE(planned->size() == 3);
        CHECK((*planned)[0].target_path == (dir / "1-1.ts").string());
        CHECK((*planned)[1].target_path == (dir / "2-1.ts").string());
        CHECK((*planned)[2].target_path == (dir / "2.ts").string());
    }

    SECTION("A prefixed name never takes a name already in use") {
        auto planned = plan_resources({"https://cdn.example.com/x/2-1.ts",
                                       "https://cdn.example.com/a/1.ts",
                                       "https://cdn.example.com/b/1.ts"}, dir);
        REQUIRE(planned.has_value());
        CHECK((*planned)[0].target_path == (dir / "2-1.ts").string());
        CHECK((*planned)[1].target_path == (dir / "2-2-1.ts").string());
        CHECK((*planned)[2].target_path == (dir / "3-1.ts").string());
    }

    SECTION("The same URL twice keeps one target") {
        auto planned = plan_resources({"https://cdn.example.com/a/1.ts",
                                       "https://cdn.example.com/a/1.ts"}, dir);
        REQUIRE(planned.has_value());
        CHECK((*planned)[0].target_path == (dir / "1.ts").string());
        CHECK((*planned)[1].target_path == (dir / "1.ts").string());
    }

    SECTION("Invalid URLs are rejected") {
        CHECK_FALSE(plan_resources({"not a url"}, dir).has_value());
    }
}

TEST_CASE("ProgressBar formatting", "[cli]") {
    CHECK(ProgressBar::format_bytes(512) == "512 B");
    CHECK(ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(ProgressBar::format_bytes(5 * 1024 * 1024 + 512 * 1024) == "5.5 MB");
    CHECK(ProgressBar::format_speed(100) == "100 B/s");
    CHECK(ProgressBar::format_speed(1536) == "1.5 KB/s");
    CHECK(ProgressBar::format_time(42) == "42s");
    CHECK(ProgressBar::format_time(125) == "2m 5s");
    CHECK(ProgressBar::format_time(3 * 3600 + 5 * 60) == "3h 05m");
}

TEST_CASE("parse_log_level", "[cli]") {
    using reel::core::parse_log_level;
    CHECK(parse_log_level("debug") == spdlog::level::debug);
    CHECK(parse_log_level("warning") == spdlog::level::warn);
    CHECK(parse_log_level("off") == spdlog::level::off);
    CHECK(parse_log_level("chatty") == spdlog::level::info);
}
