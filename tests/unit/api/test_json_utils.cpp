/**
 * @file test_json_utils.cpp
 * @brief Unit tests for JSON reading and writing helpers
 */

#include <gtest/gtest.h>

#include <kcenon/storage_transfer/api/json_utils.h>

#include <chrono>
#include <string>

namespace kcenon::storage_transfer::test {

namespace json = json_utils;

// ============================================================================
// Reading
// ============================================================================

class JsonReadTest : public ::testing::Test {
protected:
    const std::string body_ = R"({
        "uploadId": "up-1",
        "size": 51200,
        "bigSize": "9007199254740993",
        "isPublic": false,
        "note": null,
        "meta": {"uploadId": "nested", "depth": 2},
        "files": [{"id": "a"}, {"id": "b"}],
        "quoted": "line\nbreak \"q\""
    })";
};

TEST_F(JsonReadTest, ScalarMembers) {
    EXPECT_EQ(json::get_string(body_, "uploadId"), std::optional<std::string>("up-1"));
    EXPECT_EQ(json::get_uint(body_, "size"), std::optional<uint64_t>(51200));
    EXPECT_EQ(json::get_bool(body_, "isPublic"), std::optional<bool>(false));
}

TEST_F(JsonReadTest, MissingAndNullAreNullopt) {
    EXPECT_FALSE(json::get_string(body_, "absent").has_value());
    EXPECT_FALSE(json::get_string(body_, "note").has_value());
    EXPECT_FALSE(json::get_uint(body_, "note").has_value());
}

TEST_F(JsonReadTest, NumericStringsAreAccepted) {
    auto big = json::get_number(body_, "bigSize");
    ASSERT_TRUE(big.has_value());
    EXPECT_GT(*big, 9.0e15);
}

TEST_F(JsonReadTest, LookupIgnoresNestedKeys) {
    auto meta = json::get_object(body_, "meta");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(json::get_string(*meta, "uploadId"), std::optional<std::string>("nested"));
    EXPECT_EQ(json::get_uint(*meta, "depth"), std::optional<uint64_t>(2));
    EXPECT_FALSE(json::get_uint(body_, "depth").has_value());
}

TEST_F(JsonReadTest, ArrayElements) {
    auto files = json::get_array(body_, "files");
    ASSERT_TRUE(files.has_value());
    ASSERT_EQ(files->size(), 2u);
    EXPECT_EQ(json::get_string((*files)[1], "id"), std::optional<std::string>("b"));
}

TEST_F(JsonReadTest, StringsAreUnescaped) {
    auto quoted = json::get_string(body_, "quoted");
    ASSERT_TRUE(quoted.has_value());
    EXPECT_EQ(*quoted, "line\nbreak \"q\"");
}

TEST_F(JsonReadTest, ObjectValidation) {
    EXPECT_TRUE(json::is_object(body_));
    EXPECT_TRUE(json::is_object("{}"));
    EXPECT_FALSE(json::is_object(R"({"a":1)"));
    EXPECT_FALSE(json::is_object("[1,2]"));
    EXPECT_FALSE(json::is_object("<html>bad gateway</html>"));
}

TEST_F(JsonReadTest, FlattenScalarsToMap) {
    auto map = json::to_string_map(R"({"Cache-Control":"private","max":300,"ok":true,"x":{"y":1}})");
    EXPECT_EQ(map.size(), 3u);
    EXPECT_EQ(map["Cache-Control"], "private");
    EXPECT_EQ(map["max"], "300");
    EXPECT_EQ(map["ok"], "true");
    EXPECT_EQ(map.count("x"), 0u);
}

// ============================================================================
// Writing
// ============================================================================

TEST(JsonWriteTest, ObjectBuilderKeepsOrderAndEscapes) {
    std::optional<std::string> absent;
    auto body = json::object_builder()
                    .add("filename", "a \"b\".txt")
                    .add("size", uint64_t{10})
                    .add("isPublic", true)
                    .add_if("clientHash", absent)
                    .add_raw("meta", R"({"k":"v"})")
                    .str();

    EXPECT_EQ(body, R"({"filename":"a \"b\".txt","size":10,"isPublic":true,"meta":{"k":"v"}})");
    EXPECT_TRUE(json::is_object(body));
}

TEST(JsonWriteTest, EscapeControlCharacters) {
    EXPECT_EQ(json::escape("a\tb\\c"), "a\\tb\\\\c");
}

// ============================================================================
// Time and URL helpers
// ============================================================================

TEST(JsonTimeTest, ParsesUtcAndOffsets) {
    auto utc = json::parse_iso8601("2025-01-01T00:00:00Z");
    auto offset = json::parse_iso8601("2025-01-01T09:00:00+09:00");
    auto fractional = json::parse_iso8601("2025-01-01T00:00:00.250Z");

    ASSERT_TRUE(utc && offset && fractional);
    EXPECT_EQ(utc->time_since_epoch(), std::chrono::seconds(1735689600));
    EXPECT_EQ(*utc, *offset);
    EXPECT_EQ(*fractional - *utc, std::chrono::milliseconds(250));
}

TEST(JsonTimeTest, RejectsGarbage) {
    EXPECT_FALSE(json::parse_iso8601("yesterday").has_value());
    EXPECT_FALSE(json::parse_iso8601("2025-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(json::parse_iso8601("2025-01-01T00:00:00Zjunk").has_value());
}

TEST(JsonTimeTest, FormatsWithMilliseconds) {
    std::chrono::system_clock::time_point tp(std::chrono::seconds(1735689600));
    tp += std::chrono::milliseconds(7);
    EXPECT_EQ(json::format_iso8601(tp), "2025-01-01T00:00:00.007Z");
    EXPECT_EQ(json::parse_iso8601(json::format_iso8601(tp)), tp);
}

TEST(JsonUrlTest, EncodesReservedCharacters) {
    EXPECT_EQ(json::url_encode("file 1/\xC3\xA4"), "file%201%2F%C3%A4");
    EXPECT_EQ(json::url_encode("a-b_c.d~e"), "a-b_c.d~e");
}

}  // namespace kcenon::storage_transfer::test
