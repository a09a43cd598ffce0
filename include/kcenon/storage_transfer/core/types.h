/**
 * @file types.h
 * @brief Core type definitions for storage_trans_system
 */

#ifndef KCENON_STORAGE_TRANSFER_CORE_TYPES_H
#define KCENON_STORAGE_TRANSFER_CORE_TYPES_H

#include <kcenon/storage_transfer/core/error_kind.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::storage_transfer {

/**
 * @brief Structured error reported across every public boundary
 *
 * Carries the canonical kind, the backend dispatch code when one was sent,
 * and whether the kind is retryable at all. Per-call-site retry decisions are
 * made by retry_policy.
 */
struct error {
    error_kind kind;
    std::string message;
    std::string code;  ///< Backend code such as "STORAGE_ERROR", empty if none
    int http_status;
    bool retryable;
    std::optional<std::chrono::milliseconds> retry_after;
    std::map<std::string, std::string> details;

    error() : kind(error_kind::internal), http_status(0), retryable(false) {}

    explicit error(error_kind k)
        : kind(k), message(to_string(k)), http_status(0),
          retryable(is_retryable_kind(k)) {}

    error(error_kind k, std::string msg)
        : kind(k), message(std::move(msg)), http_status(0),
          retryable(is_retryable_kind(k)) {}

    error(backend_error_code c, std::string msg)
        : kind(kind_of(c)), message(std::move(msg)), code(to_string(c)),
          http_status(0), retryable(is_retryable_kind(kind_of(c))) {}

    auto with_status(int status) -> error& {
        http_status = status;
        return *this;
    }

    auto with_detail(std::string key, std::string value) -> error& {
        details[std::move(key)] = std::move(value);
        return *this;
    }

    [[nodiscard]] auto detail(const std::string& key) const -> std::optional<std::string> {
        auto it = details.find(key);
        if (it == details.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Client-generated identifier of an upload session
 */
struct session_id {
    std::string value;

    session_id() = default;
    explicit session_id(std::string v) : value(std::move(v)) {}

    /**
     * @brief Generate a process-unique identifier
     *
     * Format: upload_<epoch-ms>_<random hex>_<sequence>
     */
    [[nodiscard]] static auto generate() -> session_id;

    [[nodiscard]] auto empty() const noexcept -> bool { return value.empty(); }

    [[nodiscard]] auto operator==(const session_id& other) const -> bool = default;
    [[nodiscard]] auto operator<(const session_id& other) const -> bool {
        return value < other.value;
    }
};

}  // namespace kcenon::storage_transfer

// Hash support for session_id
template <>
struct std::hash<kcenon::storage_transfer::session_id> {
    auto operator()(const kcenon::storage_transfer::session_id& id) const noexcept
        -> std::size_t {
        return std::hash<std::string>{}(id.value);
    }
};

#endif  // KCENON_STORAGE_TRANSFER_CORE_TYPES_H
