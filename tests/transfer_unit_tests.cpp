// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/transfer_unit.hpp>
#include <reel/disk/error.hpp>
#include "test_support.hpp"

using namespace reel::core;
using namespace reel::test;

namespace {

const std::string URL = "https://cdn.example.com/tracks/01.mp3";

UnitDescriptor descriptor_for(const std::string& target, const std::string& url = URL) {
    auto d = UnitDescriptor::make(url, target, "album-1", "tracks/01.mp3");
    REQUIRE(d.has_value());
    return *d;
}

} // namespace

TEST_CASE("TransferUnit downloads a fresh resource", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    const std::string body = make_body(25 * 1024);
    transport.add(URL, {body});
    transport.chunk_size(1024);

    TransferUnit unit(descriptor_for(dir.file("01.mp3")));
    RecordingReporter reporter;

    auto state = unit.run(transport, reporter, {}, TransferOptions{20});

    REQUIRE(state == UnitState::completed);
    CHECK(unit.state() == UnitState::completed);
    CHECK(!unit.last_error());
    CHECK(read_file(unit.target_path()) == body);
    CHECK(unit.remote_size() == static_cast<std::int64_t>(body.size()));

    SECTION("First callback is IN_PROGRESS with no bytes") {
        auto calls = reporter.calls();
        REQUIRE(!calls.empty());
        CHECK(calls.front().state == UnitState::in_progress);
        CHECK(calls.front().bytes == 0);
        CHECK(calls.front().unit_id == unit.id());
    }

    SECTION("Reported bytes equal the bytes written") {
        CHECK(reporter.reported_bytes() == body.size());
    }

    SECTION("Deltas are batched every 20 reads and flushed before the end") {
        // 25 reads: one batch at 20, remainder flushed before COMPLETED
        CHECK(reporter.delta_count() == 2);
        auto calls = reporter.calls();
        CHECK(calls[1].bytes == 20 * 1024);
        CHECK(calls[2].bytes == 5 * 1024);
    }

    SECTION("Exactly one terminal callback, last, with zero bytes") {
        CHECK(reporter.terminal_count() == 1);
        auto calls = reporter.calls();
        CHECK(calls.back().state == UnitState::completed);
        CHECK(calls.back().bytes == 0);
    }
}

TEST_CASE("TransferUnit zero-byte reads never produce callbacks", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    const std::string body = make_body(3000);
    transport.add(URL, {body});
    transport.chunk_size(1000);
    transport.empty_reads(7);

    TransferUnit unit(descriptor_for(dir.file("01.mp3")));
    RecordingReporter reporter;

    // 3 data reads + 21 empty reads; report every 5 reads
    REQUIRE(unit.run(transport, reporter, {}, TransferOptions{5}) == UnitState::completed);

    // Only the opening callback carries no bytes
    auto calls = reporter.calls();
    for (std::size_t i = 1; i + 1 < calls.size(); ++i) {
        CHECK(calls[i].state == UnitState::in_progress);
        CHECK(calls[i].bytes > 0);
    }
    CHECK(reporter.reported_bytes() == body.size());
    CHECK(read_file(unit.target_path()) == body);
}

TEST_CASE("TransferUnit short-circuits a complete local file", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    const std::string body = make_body(4096);
    transport.add(URL, {body});

    const std::string target = dir.file("01.mp3");
    write_file(target, body);

    TransferUnit unit(descriptor_for(target));
    RecordingReporter reporter;

    REQUIRE(unit.run(transport, reporter, {}) == UnitState::completed);

    CHECK(transport.get_calls(URL) == 0);
    CHECK(reporter.reported_bytes() == 0);
    auto calls = reporter.calls();
    REQUIRE(calls.size() == 2);
    CHECK(calls[0].state == UnitState::in_progress);
    CHECK(calls[1].state == UnitState::completed);
}

TEST_CASE("TransferUnit creates an empty file for an empty resource", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    transport.add(URL, {""});

    TransferUnit unit(descriptor_for(dir.file("silence.mp3")));
    RecordingReporter reporter;

    REQUIRE(unit.run(transport, reporter, {}) == UnitState::completed);
    CHECK(fs::exists(unit.target_path()));
    CHECK(fs::file_size(unit.target_path()) == 0);
    CHECK(transport.get_calls(URL) == 0);
}

TEST_CASE("TransferUnit restarts when the local file is longer than the remote", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    const std::string body = make_body(1000);
    transport.add(URL, {body});

    const std::string target = dir.file("01.mp3");
    write_file(target, make_body(2500, 'K'));

    TransferUnit unit(descriptor_for(target));
    RecordingReporter reporter;

    REQUIRE(unit.run(transport, reporter, {}) == UnitState::completed);
    CHECK(reporter.truncated() == 2500);
    REQUIRE(transport.offsets(URL).size() == 1);
    CHECK(transport.offsets(URL).front() == 0);
    CHECK(read_file(target) == body);
    CHECK(reporter.reported_bytes() == body.size());
}

TEST_CASE("TransferUnit resumes a partial file from its length", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    const std::string body = make_body(5000);
    transport.add(URL, {body});

    const std::string target = dir.file("01.mp3");
    write_file(target, body.substr(0, 1234));

    TransferUnit unit(descriptor_for(target));
    RecordingReporter reporter;

    REQUIRE(unit.run(transport, reporter, {}) == UnitState::completed);
    REQUIRE(transport.offsets(URL).size() == 1);
    CHECK(transport.offsets(URL).front() == 1234);
    CHECK(reporter.reported_bytes() == body.size() - 1234);
    CHECK(read_file(target) == body);
}

TEST_CASE("TransferUnit cancellation stops and keeps partial bytes", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    const std::string body = make_body(10'000);
    transport.add(URL, {body});
    transport.chunk_size(500);

    const std::string target = dir.file("01.mp3");
    TransferUnit unit(descriptor_for(target));

    std::stop_source stop;
    RecordingReporter reporter;
    std::uint64_t seen = 0;
    reporter.on_call = [&](const Callback& c) {
        seen += c.bytes;
        if (seen >= 2000) {
            stop.request_stop();
        }
    };

    auto state = unit.run(transport, reporter, stop.get_token(), TransferOptions{1});

    REQUIRE(state == UnitState::stopped);
    CHECK(unit.last_error() == TransferErrc::cancelled);
    CHECK(reporter.terminal_count() == 1);
    CHECK(reporter.calls().back().state == UnitState::stopped);

    const auto partial = fs::file_size(target);
    CHECK(partial > 0);
    CHECK(partial < body.size());
    CHECK(partial <= reporter.reported_bytes());

    SECTION("Resume continues from the written offset without duplicating bytes") {
        RecordingReporter second;
        REQUIRE(unit.run(transport, second, {}, TransferOptions{1}) == UnitState::completed);

        auto offsets = transport.offsets(URL);
        REQUIRE(offsets.size() == 2);
        CHECK(offsets[1] == partial);
        CHECK(second.reported_bytes() == body.size() - partial);
        CHECK(read_file(target) == body);
    }
}

TEST_CASE("TransferUnit cancelled during the size probe", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    transport.add(URL, {make_body(100)});

    TransferUnit unit(descriptor_for(dir.file("01.mp3")));
    RecordingReporter reporter;
    std::stop_source stop;
    stop.request_stop();

    REQUIRE(unit.run(transport, reporter, stop.get_token()) == UnitState::stopped);
    CHECK(transport.get_calls(URL) == 0);
    CHECK(reporter.terminal_count() == 1);
}

TEST_CASE("TransferUnit falls back to unknown size when the probe fails", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    const std::string body = make_body(3000);

    SECTION("Probe network failure") {
        FakeResource r{body};
        r.probe_error = make_error_code(TransferErrc::network_error);
        transport.add(URL, r);
    }

    SECTION("Server sends no length") {
        FakeResource r{body};
        r.size_known = false;
        transport.add(URL, r);
    }

    TransferUnit unit(descriptor_for(dir.file("01.mp3")));
    RecordingReporter reporter;

    REQUIRE(unit.run(transport, reporter, {}) == UnitState::completed);
    CHECK(unit.remote_size() == UNKNOWN_SIZE);
    CHECK(read_file(unit.target_path()) == body);
    CHECK(reporter.reported_bytes() == body.size());
}

TEST_CASE("TransferUnit errors", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    RecordingReporter reporter;

    SECTION("HTTP error status") {
        FakeResource r{make_body(100)};
        r.fetch_error = make_error_code(TransferErrc::not_found);
        transport.add(URL, r);

        TransferUnit unit(descriptor_for(dir.file("01.mp3")));
        REQUIRE(unit.run(transport, reporter, {}) == UnitState::error);
        CHECK(unit.last_error() == TransferErrc::not_found);
        CHECK(reporter.terminal_count() == 1);
        CHECK(reporter.reported_bytes() == 0);
    }

    SECTION("Stream shorter than the probed size") {
        FakeResource r{make_body(100)};
        r.advertised_size = 200;
        transport.add(URL, r);

        TransferUnit unit(descriptor_for(dir.file("01.mp3")));
        REQUIRE(unit.run(transport, reporter, {}) == UnitState::error);
        CHECK(unit.last_error() == TransferErrc::size_mismatch);
        CHECK(reporter.reported_bytes() == 100);
    }

    SECTION("Parent directory cannot be created") {
        transport.add(URL, {make_body(100)});
        write_file(dir.file("blocker"), "x");

        TransferUnit unit(descriptor_for(dir.file("blocker/01.mp3")));
        REQUIRE(unit.run(transport, reporter, {}) == UnitState::error);
        CHECK(unit.last_error() == reel::disk::DiskErrc::create_dir_failed);
        CHECK(transport.probe_calls(URL) == 0);

        auto calls = reporter.calls();
        REQUIRE(calls.size() == 1);
        CHECK(calls[0].state == UnitState::error);
        CHECK(calls[0].bytes == 0);
    }
}

TEST_CASE("TransferUnit reports an unusable target name as an error", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    transport.add(URL, {""});

    // Longer than any file name the filesystem accepts
    TransferUnit unit(descriptor_for(dir.file(std::string(300, 'n') + ".mp3")));
    RecordingReporter reporter;

    REQUIRE(unit.run(transport, reporter, {}) == UnitState::error);
    CHECK(unit.last_error());
    CHECK(reporter.terminal_count() == 1);
    CHECK(transport.get_calls(URL) == 0);
}

TEST_CASE("TransferUnit creates missing parent directories", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    transport.add(URL, {make_body(64)});

    TransferUnit unit(descriptor_for(dir.file("a/b/c/01.mp3")));
    RecordingReporter reporter;

    REQUIRE(unit.run(transport, reporter, {}) == UnitState::completed);
    CHECK(fs::is_directory(dir.path() / "a/b/c"));
}

TEST_CASE("TransferUnit ignores a second concurrent run", "[unit]") {
    TempDir dir;
    FakeTransport transport;
    transport.add(URL, {make_body(2000)});
    transport.hold(true);

    TransferUnit unit(descriptor_for(dir.file("01.mp3")));
    RecordingReporter first;
    std::jthread runner([&] { (void)unit.run(transport, first, {}); });
    REQUIRE(wait_until([&] { return transport.active() == 1; }));
    CHECK(unit.is_running());

    RecordingReporter second;
    CHECK(unit.run(transport, second, {}) == UnitState::in_progress);
    CHECK(second.calls().empty());

    transport.hold(false);
    runner.join();
    CHECK(unit.state() == UnitState::completed);
    CHECK_FALSE(unit.is_running());
    CHECK(transport.get_calls(URL) == 1);
}

TEST_CASE("UnitState names", "[unit]") {
    CHECK(to_string(UnitState::in_progress) == "IN_PROGRESS");
    CHECK(unit_state_from_string("STOPPED") == UnitState::stopped);
    CHECK_FALSE(unit_state_from_string("PAUSED").has_value());
    CHECK(is_terminal(UnitState::error));
    CHECK_FALSE(is_terminal(UnitState::in_progress));
}
