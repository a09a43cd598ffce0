/**
 * @file http_types.h
 * @brief HTTP request/response abstraction used by the REST client
 */

#ifndef KCENON_STORAGE_TRANSFER_API_HTTP_TYPES_H
#define KCENON_STORAGE_TRANSFER_API_HTTP_TYPES_H

#include "kcenon/storage_transfer/core/types.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::storage_transfer {

/**
 * @brief HTTP response
 */
struct http_response {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    [[nodiscard]] auto body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }

    /**
     * @brief Header value by name, compared case-insensitively
     */
    [[nodiscard]] auto header(const std::string& name) const -> std::optional<std::string> {
        auto exact = headers.find(name);
        if (exact != headers.end()) {
            return exact->second;
        }

        auto equals_ci = [](const std::string& a, const std::string& b) {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                       return std::tolower(static_cast<unsigned char>(x)) ==
                              std::tolower(static_cast<unsigned char>(y));
                   });
        };
        for (const auto& [key, value] : headers) {
            if (equals_ci(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }
};

/**
 * @brief HTTP client used for REST calls and buffered PUTs
 *
 * A transport failure (no HTTP response at all) is an error with kind
 * network or timeout. Any HTTP response, including 4xx and 5xx, is a value;
 * callers classify the status.
 *
 * Implementations must be safe for concurrent use.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    virtual auto get(const std::string& url,
                     const std::map<std::string, std::string>& query,
                     const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    virtual auto post(const std::string& url,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    virtual auto put(const std::string& url,
                     const std::vector<uint8_t>& body,
                     const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    virtual auto del(const std::string& url,
                     const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

}  // namespace kcenon::storage_transfer

#endif  // KCENON_STORAGE_TRANSFER_API_HTTP_TYPES_H
