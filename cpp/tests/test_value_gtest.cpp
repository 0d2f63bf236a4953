// ==============================================================================
// test_value_gtest.cpp - Тесты дерева значений (GoogleTest)
// ==============================================================================

#include <raven/value.hpp>

#include <gtest/gtest.h>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <limits>
#include <stdexcept>
#include <string>

namespace raven::test {

namespace {

std::string to_json(const Value& value) {
    rapidjson::Document doc;
    value.to_rapidjson(doc, doc.GetAllocator());
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

}  // namespace

TEST(ValueTest, Scalars) {
    EXPECT_TRUE(Value().is_null());
    EXPECT_TRUE(Value(true).as_bool());
    EXPECT_EQ(Value(std::int64_t{-5}).as_int(), -5);
    EXPECT_EQ(Value(std::uint64_t{7}).as_uint(), 7u);
    EXPECT_EQ(Value("sha256").as_string(), "sha256");
    EXPECT_TRUE(Value().empty());
    EXPECT_FALSE(Value(std::int64_t{0}).empty());
}

TEST(ValueTest, ObjectKeysAreOrdered) {
    // Arrange
    Value meta = Value::make_object();
    meta.set("pie", Value(true));
    meta.set("libraries", Value::make_string_array({"libc.so.6", "libm.so.6"}));
    meta.set("entry", Value(std::uint64_t{4096}));

    // Act
    const std::string json = to_json(meta);

    // Assert
    EXPECT_EQ(json, R"({"entry":4096,"libraries":["libc.so.6","libm.so.6"],"pie":true})");
    EXPECT_EQ(meta.size(), 3u);
    ASSERT_NE(meta.get("libraries"), nullptr);
    EXPECT_EQ(meta.get("libraries")->size(), 2u);
    EXPECT_EQ(meta.get("missing"), nullptr);
}

TEST(ValueTest, PushBackAndSetIgnoreWrongKind) {
    Value scalar("x");
    scalar.push_back(Value(true));
    scalar.set("k", Value(true));
    EXPECT_TRUE(scalar.is_string());

    Value arr = Value::make_array();
    EXPECT_TRUE(arr.empty());
    arr.push_back(Value(std::int64_t{1}));
    arr.push_back(Value("two"));
    EXPECT_EQ(arr.size(), 2u);
    EXPECT_EQ(to_json(arr), R"([1,"two"])");
}

TEST(ValueTest, DisplayString) {
    Value meta = Value::make_object();
    meta.set("relro", Value("full"));
    meta.set("flags", Value::make_string_array({"pie", "nx"}));
    EXPECT_EQ(meta.to_display_string(), "{flags: [pie, nx], relro: full}");
    EXPECT_EQ(Value().to_display_string(), "null");
}

TEST(ValueTest, NonFiniteDouble_Throws) {
    rapidjson::Document doc;
    EXPECT_THROW(Value(std::numeric_limits<double>::infinity()).to_rapidjson(doc, doc.GetAllocator()),
                 std::runtime_error);
}

}  // namespace raven::test
