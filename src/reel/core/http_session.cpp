// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reel/core/http_session.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>

namespace reel::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// Per-request state shared with the libcurl callbacks
struct TransferContext {
    std::stop_token stop;
    const ChunkHandler* on_chunk{nullptr};
    std::error_code error;   // First error raised by a callback
};

// Header callback for HEAD responses
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    return HttpSession::store_header(std::string_view(buffer, total), *headers) ? total : 0;
}

// Body callback for GET: one call per transport read
std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    std::size_t bytes = size * nmemb;

    if (ctx->stop.stop_requested()) {
        ctx->error = make_error_code(TransferErrc::cancelled);
        return 0;
    }

    try {
        if (auto ec = (*ctx->on_chunk)(std::string_view(ptr, bytes))) {
            ctx->error = ec;
            return 0;  // Abort the transfer
        }
    } catch (const std::exception& e) {
        spdlog::error("Chunk handler threw: {}", e.what());
        ctx->error = make_error_code(TransferErrc::network_error);
        return 0;
    }
    return bytes;
}

// Progress callback - aborts the transfer once a stop is requested
int xferinfo_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* ctx = static_cast<TransferContext*>(userdata);
    return ctx->stop.stop_requested() ? 1 : 0;
}

void apply_common_options(CURL* curl, const HttpOptions& opts, TransferContext& ctx) {
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts.connect_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(opts.read_timeout_sec));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.user_agent.c_str());

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(opts.max_redirects));
    }

    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
}

} // namespace

//=============================================================================
// HttpOptions
//=============================================================================

HttpOptions HttpOptions::from(const EngineConfig& cfg) {
    HttpOptions opts;
    opts.connect_timeout_sec = cfg.connect_timeout_sec;
    opts.read_timeout_sec = cfg.read_timeout_sec;
    opts.max_redirects = cfg.max_redirects;
    opts.buffer_size = cfg.buffer_size;
    opts.user_agent = cfg.user_agent;
    return opts;
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options)
    : options_(std::move(options)) {}

std::expected<HttpResponse, std::error_code>
HttpSession::head(const std::string& url, std::stop_token stop) noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(TransferErrc::cancelled));
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }

    HttpResponse response{};
    TransferContext ctx{stop, nullptr, {}};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    apply_common_options(curl.ptr, options_, ctx);

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &response.headers);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (result == CURLE_ABORTED_BY_CALLBACK || stop.stop_requested()) {
        return std::unexpected(make_error_code(TransferErrc::cancelled));
    }
    if (result != CURLE_OK) {
        return std::unexpected(curl_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);
    if (auto ec = status_error(http_code)) {
        return std::unexpected(ec);
    }

    // Content-Length from the final header block
    auto cl_it = response.headers.find("content-length");
    if (cl_it != response.headers.end() && !cl_it->second.empty()) {
        char* end = nullptr;
        long long val = std::strtoll(cl_it->second.c_str(), &end, 10);
        if (end == cl_it->second.c_str() + cl_it->second.size() && val >= 0) {
            response.content_length = static_cast<std::int64_t>(val);
        }
    }

    auto ct_it = response.headers.find("content-type");
    if (ct_it != response.headers.end()) {
        response.content_type = ct_it->second;
    }

    auto ar_it = response.headers.find("accept-ranges");
    response.accepts_ranges = (ar_it != response.headers.end() && ar_it->second.find("bytes") != std::string::npos);

    return response;
}

std::expected<std::int64_t, std::error_code>
HttpSession::probe_size(const std::string& url, std::stop_token stop) noexcept {
    auto response = head(url, stop);
    if (!response) {
        return std::unexpected(response.error());
    }
    return response->content_length;
}

std::error_code HttpSession::fetch(const std::string& url, std::uint64_t offset,
                                   std::stop_token stop, const ChunkHandler& on_chunk) noexcept {
    if (stop.stop_requested()) {
        return make_error_code(TransferErrc::cancelled);
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return make_error_code(TransferErrc::network_error);
    }

    TransferContext ctx{stop, &on_chunk, {}};

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    apply_common_options(curl.ptr, options_, ctx);

    // Range resume. libcurl rejects a 200 reply to a ranged request (CURLE_RANGE_ERROR).
    if (offset > 0) {
        curl_easy_setopt(curl.ptr, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
    }

    // Fail on >= 400 before any body byte reaches the handler
    curl_easy_setopt(curl.ptr, CURLOPT_FAILONERROR, 1L);

    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(options_.buffer_size));
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

    CURLcode result = curl_easy_perform(curl.ptr);

    if (ctx.error) {
        return ctx.error;
    }
    if (result == CURLE_OK) {
        return {};
    }
    if (result == CURLE_ABORTED_BY_CALLBACK || stop.stop_requested()) {
        return make_error_code(TransferErrc::cancelled);
    }
    if (result == CURLE_HTTP_RETURNED_ERROR) {
        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        spdlog::debug("GET {} returned HTTP {}", url, http_code);
        return status_error(http_code);
    }

    spdlog::debug("GET {} failed: curl error {} ({})", url, static_cast<int>(result),
                  curl_easy_strerror(result));
    return curl_error(result);
}

bool HttpSession::store_header(std::string_view line, std::map<std::string, std::string>& headers) noexcept {
    // A new status line starts a new header block (redirects)
    if (line.starts_with("HTTP/")) {
        headers.clear();
        return true;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return true;

    auto name = line.substr(0, colon);
    auto value = line.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    try {
        std::string lower_name;
        lower_name.reserve(name.size());
        for (char c : name) {
            lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        headers[lower_name] = std::string(value);
    } catch (const std::bad_alloc&) {
        return false;
    }
    return true;
}

std::error_code HttpSession::status_error(long http_code) noexcept {
    if (http_code < 400) {
        return {};
    }
    if (http_code == 404) {
        return make_error_code(TransferErrc::not_found);
    }
    if (http_code == 416) {
        return make_error_code(TransferErrc::invalid_range);
    }
    if (http_code >= 500) {
        return make_error_code(TransferErrc::server_error);
    }
    return make_error_code(TransferErrc::http_status);
}

std::error_code HttpSession::curl_error(int curl_code) noexcept {
    switch (static_cast<CURLcode>(curl_code)) {
        case CURLE_OK:
            return {};
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(TransferErrc::cancelled);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(TransferErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(TransferErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TransferErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(TransferErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(TransferErrc::too_many_redirects);
        case CURLE_RANGE_ERROR:
            return make_error_code(TransferErrc::invalid_range);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(TransferErrc::invalid_url);
        default:
            return make_error_code(TransferErrc::network_error);
    }
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace reel::core
