// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace blobxfer::core {

// Caller-supplied request headers, passed through unmodified (auth included)
using Headers = std::map<std::string, std::string>;

struct HttpRequest {
    std::string url;
    Headers headers;
};

struct HttpResponse {
    std::int32_t status_code{0};
    Headers headers;                            // Names are lower-case
    std::optional<std::uint64_t> content_length;
    bool body_truncated{false};                 // Body callback stopped the transfer

    // Case-insensitive header lookup
    [[nodiscard]] const std::string* header(std::string_view name) const noexcept;
};

// Receives the body of 2xx responses as it streams in; bodies of other
// responses are discarded. Return false to stop reading the body.
using BodyCallback = std::function<bool(const char* data, std::size_t size)>;

// Blocking HTTP GET with custom headers. Implementations must be safe to
// call from several threads at once.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Transport failures are returned as errors; any HTTP status is a response.
    [[nodiscard]] virtual std::expected<HttpResponse, std::error_code>
    get(const HttpRequest& request, const BodyCallback& on_body) noexcept = 0;
};

// Copy of `headers` with any Range header replaced by `range_value`
[[nodiscard]] Headers with_range(const Headers& headers, std::string_view range_value);

// Lower-case ASCII copy
[[nodiscard]] std::string to_lower(std::string_view s);

} // namespace blobxfer::core
