// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <blobxfer/core/config.hpp>
#include <blobxfer/core/http_client.hpp>
#include <cstdint>
#include <string>

namespace blobxfer::core {

struct HttpClientConfig {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};  // Abort below 1 B/s for this long
    std::uint32_t max_redirects{MAX_REDIRECTS};
    bool follow_redirects{true};
    bool verify_ssl{true};
    std::string user_agent;
};

// libcurl-backed HttpClient. Every request uses its own easy handle, so
// one session can serve all workers of a transfer.
class HttpSession final : public HttpClient {
public:
    HttpSession() = default;
    explicit HttpSession(HttpClientConfig config);

    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request, const BodyCallback& on_body) noexcept override;

    [[nodiscard]] const HttpClientConfig& config() const noexcept { return config_; }

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpClientConfig config_;
};

} // namespace blobxfer::core
