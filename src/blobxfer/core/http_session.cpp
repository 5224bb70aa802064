// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/http_session.hpp>
#include <blobxfer/core/byte_range.hpp>
#include <blobxfer/core/error.hpp>
#include <blobxfer/core/logging.hpp>
#include <blobxfer/version.hpp>
#include <curl/curl.h>
#include <exception>
#include <memory>
#include <string_view>

namespace blobxfer::core {

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

struct SlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using SlistPtr = std::unique_ptr<curl_slist, SlistDeleter>;

// State shared with the libcurl callbacks of one request
struct RequestContext {
    CURL* curl{nullptr};
    HttpResponse* response{nullptr};
    const BodyCallback* on_body{nullptr};
    bool stopped{false};
};

// Header callback: collects lower-cased headers of the final response
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* ctx = static_cast<RequestContext*>(userdata);
    if (!ctx) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new response (redirect, 100 Continue)
    if (header.starts_with("HTTP/")) {
        ctx->response->headers.clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    // Trim whitespace and \r\n
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    ctx->response->headers[to_lower(name)] = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    std::size_t total = size * nmemb;
    auto* ctx = static_cast<RequestContext*>(userdata);
    if (!ctx) return 0;

    long http_code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);

    // Error bodies never reach the caller
    if (http_code < 200 || http_code >= 300 || !ctx->on_body || !*ctx->on_body) {
        return total;
    }

    if (!(*ctx->on_body)(ptr, total)) {
        ctx->stopped = true;
        return 0;  // Makes libcurl abort with CURLE_WRITE_ERROR
    }
    return total;
}

std::error_code translate(CURLcode code) noexcept {
    switch (code) {
        case CURLE_OK:
            return {};
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(TransferErrc::timeout);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(TransferErrc::dns_error);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(TransferErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(TransferErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(TransferErrc::invalid_url);
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(TransferErrc::aborted);
        default:
            return make_error_code(TransferErrc::network_error);
    }
}

} // namespace

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpClientConfig config)
    : config_(std::move(config)) {}

std::expected<HttpResponse, std::error_code>
HttpSession::get(const HttpRequest& request, const BodyCallback& on_body) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(TransferErrc::network_error));
        }

        HttpResponse response{};
        RequestContext ctx{curl.ptr, &response, &on_body, false};

        curl_easy_setopt(curl.ptr, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);

        // Caller headers go through untouched
        curl_slist* raw_list = nullptr;
        for (const auto& [name, value] : request.headers) {
            std::string line = name + ": " + value;
            curl_slist* next = curl_slist_append(raw_list, line.c_str());
            if (!next) {
                curl_slist_free_all(raw_list);
                return std::unexpected(make_error_code(TransferErrc::network_error));
            }
            raw_list = next;
        }
        SlistPtr header_list(raw_list);
        if (header_list) {
            curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, header_list.get());
        }

        std::string user_agent = config_.user_agent.empty()
            ? "blobxfer/" + blobxfer::version.to_string()
            : config_.user_agent;
        curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent.c_str());

        if (config_.follow_redirects) {
            curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(config_.max_redirects));
        }
        curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_sec));
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.stall_timeout_sec));
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);  // Required for multi-threaded use
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(STREAM_BUFFER_SIZE));

        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &ctx);

        CURLcode result = curl_easy_perform(curl.ptr);

        if (result == CURLE_WRITE_ERROR && ctx.stopped) {
            response.body_truncated = true;
        } else if (result != CURLE_OK) {
            logger()->debug("GET {} failed: {}", request.url, curl_easy_strerror(result));
            return std::unexpected(translate(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<std::int32_t>(http_code);

        // Content length from headers; curl's value is only valid after a full body
        if (auto* cl = response.header("content-length")) {
            response.content_length = parse_uint(*cl);
        }
        if (!response.content_length && !response.body_truncated) {
            curl_off_t cl = -1;
            if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &cl) == CURLE_OK && cl >= 0) {
                response.content_length = static_cast<std::uint64_t>(cl);
            }
        }

        return response;
    } catch (const std::exception& e) {
        logger()->error("GET {} raised: {}", request.url, e.what());
        return std::unexpected(make_error_code(TransferErrc::network_error));
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

} // namespace blobxfer::core
