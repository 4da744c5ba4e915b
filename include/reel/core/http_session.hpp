// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reel/core/config.hpp>
#include <reel/core/error.hpp>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <stop_token>
#include <string>
#include <string_view>

namespace reel::core {

// HTTP response headers
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;   // Lowercase names
    std::int64_t content_length{UNKNOWN_SIZE};
    bool accepts_ranges{false};
    std::string content_type;
};

// Receives one transport read. An error return aborts the transfer with that error.
using ChunkHandler = std::function<std::error_code(std::string_view chunk)>;

// Resource transport consumed by TransferUnit
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Metadata-only size probe. UNKNOWN_SIZE when the server sends no length.
    [[nodiscard]] virtual std::expected<std::int64_t, std::error_code>
    probe_size(const std::string& url, std::stop_token stop) noexcept = 0;

    // GET from offset to the end of the resource (Range: bytes=offset-).
    // Status >= 400 is returned as an error before any chunk is delivered.
    [[nodiscard]] virtual std::error_code
    fetch(const std::string& url, std::uint64_t offset, std::stop_token stop,
          const ChunkHandler& on_chunk) noexcept = 0;
};

struct HttpOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t read_timeout_sec{READ_TIMEOUT_SEC};
    std::uint32_t max_redirects{MAX_REDIRECTS};
    std::size_t buffer_size{READ_BUFFER_SIZE};
    std::string user_agent{DEFAULT_USER_AGENT};

    [[nodiscard]] static HttpOptions from(const EngineConfig& cfg);
};

// libcurl transport. Every request uses its own easy handle, so one session
// may serve all worker threads at once.
class HttpSession final : public HttpTransport {
public:
    explicit HttpSession(HttpOptions options = {});
    ~HttpSession() override = default;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    // Perform HEAD request to get resource info
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url, std::stop_token stop = {}) noexcept;

    [[nodiscard]] std::expected<std::int64_t, std::error_code>
    probe_size(const std::string& url, std::stop_token stop) noexcept override;

    [[nodiscard]] std::error_code
    fetch(const std::string& url, std::uint64_t offset, std::stop_token stop,
          const ChunkHandler& on_chunk) noexcept override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Record one raw header line under its lowercase name. A status line
    // clears what was recorded before. False when out of memory.
    [[nodiscard]] static bool store_header(std::string_view line,
                                           std::map<std::string, std::string>& headers) noexcept;

    // Map an HTTP status to an error; success for codes below 400
    [[nodiscard]] static std::error_code status_error(long http_code) noexcept;

    // Map a CURLcode to an error
    [[nodiscard]] static std::error_code curl_error(int curl_code) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

} // namespace reel::core
