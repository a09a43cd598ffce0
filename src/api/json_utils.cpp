/**
 * @file json_utils.cpp
 * @brief Implementation of the JSON helpers
 */

#include "kcenon/storage_transfer/api/json_utils.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>

namespace kcenon::storage_transfer::json_utils {

namespace {

/**
 * @brief Cursor over JSON text that can step over whole values
 */
class scanner {
public:
    explicit scanner(std::string_view text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    [[nodiscard]] auto at_end() const -> bool { return pos_ >= text_.size(); }
    [[nodiscard]] auto peek() const -> char { return at_end() ? '\0' : text_[pos_]; }
    [[nodiscard]] auto pos() const -> std::size_t { return pos_; }

    auto consume(char c) -> bool {
        skip_ws();
        if (peek() != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    /**
     * @brief Step over a string literal; cursor must be on the opening quote
     */
    auto skip_string() -> bool {
        if (peek() != '"') {
            return false;
        }
        ++pos_;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '\\') {
                ++pos_;
            } else if (c == '"') {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Step over any value and return its raw text
     */
    auto read_value() -> std::optional<std::string_view> {
        skip_ws();
        auto start = pos_;
        char c = peek();

        if (c == '"') {
            if (!skip_string()) return std::nullopt;
        } else if (c == '{' || c == '[') {
            if (!skip_container()) return std::nullopt;
        } else {
            while (pos_ < text_.size()) {
                char d = text_[pos_];
                if (d == ',' || d == '}' || d == ']' ||
                    std::isspace(static_cast<unsigned char>(d))) {
                    break;
                }
                ++pos_;
            }
            if (pos_ == start) return std::nullopt;
        }
        return text_.substr(start, pos_ - start);
    }

private:
    auto skip_container() -> bool {
        int depth = 0;
        while (pos_ < text_.size()) {
            char c = text_[pos_];
            if (c == '"') {
                if (!skip_string()) return false;
                continue;
            }
            if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                --depth;
                if (depth == 0) {
                    ++pos_;
                    return true;
                }
            }
            ++pos_;
        }
        return false;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto parse_hex4(std::string_view s, std::size_t at) -> std::optional<uint32_t> {
    if (at + 4 > s.size()) return std::nullopt;
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data() + at, s.data() + at + 4, value, 16);
    if (ec != std::errc{} || ptr != s.data() + at + 4) return std::nullopt;
    return value;
}

auto days_from_civil(int y, unsigned m, unsigned d) -> int64_t {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

}  // namespace

// ============================================================================
// Reading
// ============================================================================

auto find_member(std::string_view object, std::string_view key)
    -> std::optional<std::string_view> {
    scanner sc(object);
    if (!sc.consume('{')) {
        return std::nullopt;
    }

    sc.skip_ws();
    if (sc.peek() == '}') {
        return std::nullopt;
    }

    while (true) {
        sc.skip_ws();
        auto raw_key = sc.read_value();
        if (!raw_key || raw_key->empty() || raw_key->front() != '"') {
            return std::nullopt;
        }
        if (!sc.consume(':')) {
            return std::nullopt;
        }
        auto value = sc.read_value();
        if (!value) {
            return std::nullopt;
        }

        auto name = unescape(*raw_key);
        if (name && *name == key) {
            return value;
        }

        if (sc.consume(',')) {
            continue;
        }
        return std::nullopt;
    }
}

auto get_string(std::string_view object, std::string_view key)
    -> std::optional<std::string> {
    auto raw = find_member(object, key);
    if (!raw || raw->empty() || raw->front() != '"') {
        return std::nullopt;
    }
    return unescape(*raw);
}

auto get_number(std::string_view object, std::string_view key)
    -> std::optional<double> {
    auto raw = find_member(object, key);
    if (!raw || raw->empty() || *raw == "null") {
        return std::nullopt;
    }

    std::string text;
    if (raw->front() == '"') {
        auto unquoted = unescape(*raw);
        if (!unquoted) return std::nullopt;
        text = std::string(trim(*unquoted));
    } else {
        text = std::string(*raw);
    }
    if (text.empty()) {
        return std::nullopt;
    }

    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

auto get_uint(std::string_view object, std::string_view key)
    -> std::optional<uint64_t> {
    auto value = get_number(object, key);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(std::llround(*value));
}

auto get_bool(std::string_view object, std::string_view key)
    -> std::optional<bool> {
    auto raw = find_member(object, key);
    if (!raw) return std::nullopt;
    if (*raw == "true") return true;
    if (*raw == "false") return false;
    return std::nullopt;
}

auto get_object(std::string_view object, std::string_view key)
    -> std::optional<std::string_view> {
    auto raw = find_member(object, key);
    if (!raw || raw->empty() || raw->front() != '{') {
        return std::nullopt;
    }
    return raw;
}

auto get_array(std::string_view object, std::string_view key)
    -> std::optional<std::vector<std::string_view>> {
    auto raw = find_member(object, key);
    if (!raw || raw->empty() || raw->front() != '[') {
        return std::nullopt;
    }

    std::vector<std::string_view> items;
    scanner sc(*raw);
    sc.consume('[');
    sc.skip_ws();
    if (sc.peek() == ']') {
        return items;
    }

    while (true) {
        auto item = sc.read_value();
        if (!item) {
            return std::nullopt;
        }
        items.push_back(*item);
        if (sc.consume(',')) {
            continue;
        }
        if (sc.consume(']')) {
            return items;
        }
        return std::nullopt;
    }
}

auto to_string_map(std::string_view object) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> out;
    scanner sc(object);
    if (!sc.consume('{')) {
        return out;
    }
    sc.skip_ws();
    if (sc.peek() == '}') {
        return out;
    }

    while (true) {
        sc.skip_ws();
        auto raw_key = sc.read_value();
        if (!raw_key || !sc.consume(':')) {
            return out;
        }
        auto value = sc.read_value();
        if (!value) {
            return out;
        }

        auto name = unescape(*raw_key);
        if (name && !value->empty()) {
            char first = value->front();
            if (first == '"') {
                if (auto text = unescape(*value)) {
                    out[*name] = *text;
                }
            } else if (first != '{' && first != '[' && *value != "null") {
                out[*name] = std::string(*value);
            }
        }

        if (!sc.consume(',')) {
            return out;
        }
    }
}

auto is_object(std::string_view text) -> bool {
    scanner sc(text);
    sc.skip_ws();
    if (sc.peek() != '{') {
        return false;
    }
    auto value = sc.read_value();
    if (!value) {
        return false;
    }
    sc.skip_ws();
    return sc.at_end();
}

auto unescape(std::string_view quoted) -> std::optional<std::string> {
    if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"') {
        return std::nullopt;
    }
    auto body = quoted.substr(1, quoted.size() - 2);

    std::string out;
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i) {
        char c = body[i];
        if (c != '\\') {
            out += c;
            continue;
        }
        if (++i >= body.size()) {
            return std::nullopt;
        }
        switch (body[i]) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                auto cp = parse_hex4(body, i + 1);
                if (!cp) return std::nullopt;
                i += 4;
                // Surrogate pair
                if (*cp >= 0xD800 && *cp <= 0xDBFF && body.substr(i + 1, 2) == "\\u") {
                    auto low = parse_hex4(body, i + 3);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, *cp);
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

auto escape(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size() + 8);
    for (char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// ============================================================================
// Writing
// ============================================================================

void object_builder::key(std::string_view k) {
    out_ << (first_ ? "" : ",") << '"' << escape(k) << "\":";
    first_ = false;
}

auto object_builder::add(std::string_view k, std::string_view value) -> object_builder& {
    key(k);
    out_ << '"' << escape(value) << '"';
    return *this;
}

auto object_builder::add(std::string_view k, const char* value) -> object_builder& {
    return add(k, std::string_view(value));
}

auto object_builder::add(std::string_view k, const std::string& value) -> object_builder& {
    return add(k, std::string_view(value));
}

auto object_builder::add(std::string_view k, uint64_t value) -> object_builder& {
    key(k);
    out_ << value;
    return *this;
}

auto object_builder::add(std::string_view k, int64_t value) -> object_builder& {
    key(k);
    out_ << value;
    return *this;
}

auto object_builder::add(std::string_view k, bool value) -> object_builder& {
    key(k);
    out_ << (value ? "true" : "false");
    return *this;
}

auto object_builder::add_if(std::string_view k, const std::optional<std::string>& value)
    -> object_builder& {
    if (value) {
        add(k, *value);
    }
    return *this;
}

auto object_builder::add_raw(std::string_view k, std::string_view json) -> object_builder& {
    key(k);
    out_ << json;
    return *this;
}

auto object_builder::str() const -> std::string {
    return "{" + out_.str() + "}";
}

// ============================================================================
// Time and URL helpers
// ============================================================================

auto parse_iso8601(std::string_view text)
    -> std::optional<std::chrono::system_clock::time_point> {
    std::string s(trim(text));
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    int64_t millis = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 3) {
                millis = millis * 10 + (s[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        for (int d = digits; d < 3; ++d) {
            millis *= 10;
        }
    }

    int64_t offset_seconds = 0;
    if (pos < s.size()) {
        char tz = s[pos];
        if (tz == 'Z' || tz == 'z') {
            ++pos;
        } else if (tz == '+' || tz == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                return std::nullopt;
            }
            offset_seconds = (oh * 3600 + om * 60) * (tz == '+' ? 1 : -1);
            pos += 6;
        } else {
            return std::nullopt;
        }
    }
    if (pos != s.size()) {
        return std::nullopt;
    }

    auto days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t epoch_seconds = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(epoch_seconds) + std::chrono::milliseconds(millis)));
}

auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        --time_t_val;
    }

    std::tm tm_buf{};
#if defined(_WIN32)
    gmtime_s(&tm_buf, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

auto url_encode(std::string_view value) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }
    return escaped.str();
}

}  // namespace kcenon::storage_transfer::json_utils
