// Copyright (c) 2026 changcheng967. All rights reserved.

#include <blobxfer/core/http_client.hpp>
#include <cctype>

namespace blobxfer::core {

std::string to_lower(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

const std::string* HttpResponse::header(std::string_view name) const noexcept {
    for (const auto& [key, value] : headers) {
        if (key.size() != name.size()) continue;

        bool equal = true;
        for (std::size_t i = 0; i < key.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(key[i])) !=
                std::tolower(static_cast<unsigned char>(name[i]))) {
                equal = false;
                break;
            }
        }
        if (equal) return &value;
    }
    return nullptr;
}

Headers with_range(const Headers& headers, std::string_view range_value) {
    Headers result;
    for (const auto& [key, value] : headers) {
        if (to_lower(key) != "range") {
            result.emplace(key, value);
        }
    }
    result.emplace("Range", std::string(range_value));
    return result;
}

} // namespace blobxfer::core
