// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reel/core/http_session.hpp>
#include <curl/curl.h>
#include <map>

using namespace reel::core;

TEST_CASE("HttpSession::status_error", "[http]") {
    CHECK_FALSE(HttpSession::status_error(200));
    CHECK_FALSE(HttpSession::status_error(206));
    CHECK_FALSE(HttpSession::status_error(304));
    CHECK(HttpSession::status_error(404) == TransferErrc::not_found);
    CHECK(HttpSession::status_error(416) == TransferErrc::invalid_range);
    CHECK(HttpSession::status_error(403) == TransferErrc::http_status);
    CHECK(HttpSession::status_error(500) == TransferErrc::server_error);
    CHECK(HttpSession::status_error(503) == TransferErrc::server_error);
}

TEST_CASE("HttpSession::curl_error", "[http]") {
    CHECK_FALSE(HttpSession::curl_error(CURLE_OK));
    CHECK(HttpSession::curl_error(CURLE_ABORTED_BY_CALLBACK) == TransferErrc::cancelled);
    CHECK(HttpSession::curl_error(CURLE_COULDNT_RESOLVE_HOST) == TransferErrc::dns_error);
    CHECK(HttpSession::curl_error(CURLE_COULDNT_CONNECT) == TransferErrc::refused);
    CHECK(HttpSession::curl_error(CURLE_OPERATION_TIMEDOUT) == TransferErrc::timeout);
    CHECK(HttpSession::curl_error(CURLE_PEER_FAILED_VERIFICATION) == TransferErrc::ssl_error);
    CHECK(HttpSession::curl_error(CURLE_TOO_MANY_REDIRECTS) == TransferErrc::too_many_redirects);
    CHECK(HttpSession::curl_error(CURLE_RANGE_ERROR) == TransferErrc::invalid_range);
    CHECK(HttpSession::curl_error(CURLE_UNSUPPORTED_PROTOCOL) == TransferErrc::invalid_url);
    CHECK(HttpSession::curl_error(CURLE_RECV_ERROR) == TransferErrc::network_error);
}

TEST_CASE("HttpSession::store_header", "[http]") {
    std::map<std::string, std::string> headers;

    REQUIRE(HttpSession::store_header("HTTP/1.1 302 Found\r\n", headers));
    REQUIRE(HttpSession::store_header("Location: https://cdn.example.com/b.mp3\r\n", headers));
    CHECK(headers.at("location") == "https://cdn.example.com/b.mp3");

    // The final response replaces the redirect's headers
    REQUIRE(HttpSession::store_header("HTTP/2 200\r\n", headers));
    CHECK(headers.empty());
    REQUIRE(HttpSession::store_header("Content-Length:\t4096 \r\n", headers));
    REQUIRE(HttpSession::store_header("Accept-RANGES: bytes\r\n", headers));
    REQUIRE(HttpSession::store_header("\r\n", headers));

    CHECK(headers.size() == 2);
    CHECK(headers.at("content-length") == "4096");
    CHECK(headers.at("accept-ranges") == "bytes");
}

TEST_CASE("HttpSession does not start a stopped request", "[http]") {
    HttpSession::global_init();
    HttpSession session;

    std::stop_source stop;
    stop.request_stop();

    // Unroutable address: nothing is sent
    int chunks = 0;
    auto ec = session.fetch("http://10.255.255.1/a.mp3", 0, stop.get_token(),
                            [&](std::string_view) { ++chunks; return std::error_code{}; });
    CHECK(ec == TransferErrc::cancelled);
    CHECK(chunks == 0);

    auto size = session.probe_size("http://10.255.255.1/a.mp3", stop.get_token());
    REQUIRE_FALSE(size.has_value());
    CHECK(size.error() == TransferErrc::cancelled);

    HttpSession::global_cleanup();
}

TEST_CASE("TransferErrc messages", "[http]") {
    CHECK(make_error_code(TransferErrc::not_found).message() == "Resource not found (404)");
    CHECK(make_error_code(TransferErrc::item_busy).message() == "Item is being deleted");
    CHECK(std::string(transfer_errc_category().name()) == "reel::transfer");
}
