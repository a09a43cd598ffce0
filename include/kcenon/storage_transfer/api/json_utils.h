/**
 * @file json_utils.h
 * @brief Minimal JSON reading and writing for the storage REST contract
 *
 * Responses are read by key lookup on the raw text rather than through a
 * document model. Lookups only match keys of the object they are given, so
 * nested objects are reached by extracting them first.
 */

#ifndef KCENON_STORAGE_TRANSFER_API_JSON_UTILS_H
#define KCENON_STORAGE_TRANSFER_API_JSON_UTILS_H

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::storage_transfer::json_utils {

// ============================================================================
// Reading
// ============================================================================

/**
 * @brief Raw text of a member value of a JSON object
 * @param object JSON object text
 * @param key Member name
 * @return Raw value text (e.g. "\"abc\"", "42", "{...}") or nullopt if absent
 */
auto find_member(std::string_view object, std::string_view key)
    -> std::optional<std::string_view>;

/**
 * @brief String member, unescaped; nullopt if absent, null or not a string
 */
auto get_string(std::string_view object, std::string_view key)
    -> std::optional<std::string>;

/**
 * @brief Numeric member; numeric strings are accepted (database bigints)
 */
auto get_number(std::string_view object, std::string_view key)
    -> std::optional<double>;

auto get_uint(std::string_view object, std::string_view key)
    -> std::optional<uint64_t>;

auto get_bool(std::string_view object, std::string_view key)
    -> std::optional<bool>;

/**
 * @brief Object member as raw text; nullopt if absent or not an object
 */
auto get_object(std::string_view object, std::string_view key)
    -> std::optional<std::string_view>;

/**
 * @brief Elements of an array member as raw texts
 */
auto get_array(std::string_view object, std::string_view key)
    -> std::optional<std::vector<std::string_view>>;

/**
 * @brief Flatten an object of scalars into a string map
 *
 * Strings are unescaped; numbers and booleans keep their literal text;
 * nested values and nulls are skipped.
 */
auto to_string_map(std::string_view object) -> std::map<std::string, std::string>;

/**
 * @brief Whether text is a syntactically complete JSON object
 */
auto is_object(std::string_view text) -> bool;

/**
 * @brief Decode a JSON string literal including its quotes
 */
auto unescape(std::string_view quoted) -> std::optional<std::string>;

/**
 * @brief Escape a string for embedding between quotes
 */
auto escape(std::string_view value) -> std::string;

// ============================================================================
// Writing
// ============================================================================

/**
 * @brief Builds a flat JSON object in insertion order
 *
 * @code
 * auto body = json_utils::object_builder()
 *     .add("filename", "photo.jpg")
 *     .add("size", uint64_t{51200})
 *     .add_if("clientHash", digest)
 *     .str();
 * @endcode
 */
class object_builder {
public:
    auto add(std::string_view key, std::string_view value) -> object_builder&;
    auto add(std::string_view key, const char* value) -> object_builder&;
    auto add(std::string_view key, const std::string& value) -> object_builder&;
    auto add(std::string_view key, uint64_t value) -> object_builder&;
    auto add(std::string_view key, int64_t value) -> object_builder&;
    auto add(std::string_view key, bool value) -> object_builder&;

    /**
     * @brief Add a string member only when present
     */
    auto add_if(std::string_view key, const std::optional<std::string>& value)
        -> object_builder&;

    /**
     * @brief Add pre-serialized JSON
     */
    auto add_raw(std::string_view key, std::string_view json) -> object_builder&;

    [[nodiscard]] auto str() const -> std::string;

private:
    void key(std::string_view k);

    std::ostringstream out_;
    bool first_ = true;
};

// ============================================================================
// Time and URL helpers
// ============================================================================

/**
 * @brief Parse ISO 8601 / RFC 3339 timestamps (Z or +hh:mm offsets)
 */
auto parse_iso8601(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point>;

/**
 * @brief Format as UTC with millisecond precision, e.g. 2024-05-01T12:00:00.000Z
 */
auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Percent-encode a path segment or query value
 */
auto url_encode(std::string_view value) -> std::string;

}  // namespace kcenon::storage_transfer::json_utils

#endif  // KCENON_STORAGE_TRANSFER_API_JSON_UTILS_H
