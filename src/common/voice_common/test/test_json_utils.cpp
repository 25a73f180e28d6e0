#include <gtest/gtest.h>

#include <voice_common/json_utils.hpp>
#include <voice_common/string_utils.hpp>

#include <string>

using namespace std;

namespace voice_common
{
namespace
{

TEST(JsonUtils, StringFieldUnescapes)
{
  string out;
  ASSERT_TRUE(extract_json_string_field(R"({"detail": "bad \"rate\"\nline"})", "detail", out));
  EXPECT_EQ(out, "bad \"rate\"\nline");
}

TEST(JsonUtils, KeyMustBeFollowedByColon)
{
  // "detail"이 값으로 먼저 등장해도 키 위치만 인정
  const string json = R"({"kind": "detail", "detail": "real"})";
  string out;
  ASSERT_TRUE(extract_json_string_field(json, "detail", out));
  EXPECT_EQ(out, "real");
}

TEST(JsonUtils, StringFieldRejectsNonString)
{
  string out;
  EXPECT_FALSE(extract_json_string_field(R"({"detail": 12})", "detail", out));
  EXPECT_FALSE(extract_json_string_field(R"({"other": "x"})", "detail", out));
}

TEST(JsonUtils, NumberField)
{
  double value = 0.0;
  ASSERT_TRUE(extract_json_number_field(R"({"mdvpFo": 150.2, "hnr":-3e-2})", "mdvpFo", value));
  EXPECT_DOUBLE_EQ(value, 150.2);
  ASSERT_TRUE(extract_json_number_field(R"({"mdvpFo": 150.2, "hnr":-3e-2})", "hnr", value));
  EXPECT_DOUBLE_EQ(value, -0.03);
}

TEST(JsonUtils, NumberFieldRejectsOtherTypes)
{
  double value = 0.0;
  EXPECT_FALSE(extract_json_number_field(R"({"a": "1.0"})", "a", value));
  EXPECT_FALSE(extract_json_number_field(R"({"a": null})", "a", value));
  EXPECT_FALSE(extract_json_number_field(R"({"a": true})", "a", value));
  EXPECT_FALSE(extract_json_number_field(R"({"a": {"v": 1}})", "a", value));
}

TEST(JsonUtils, NumberFieldRejectsNonFinite)
{
  double value = 7.0;
  EXPECT_FALSE(extract_json_number_field(R"({"a": NaN})", "a", value));
  EXPECT_FALSE(extract_json_number_field(R"({"a": Infinity})", "a", value));
  EXPECT_FALSE(extract_json_number_field(R"({"a": -Infinity})", "a", value));
  EXPECT_FALSE(extract_json_number_field(R"({"a": 1e999})", "a", value));
  EXPECT_DOUBLE_EQ(value, 7.0);
}

TEST(JsonUtils, RawFieldKeepsNestedObject)
{
  string out;
  const string json = R"({"detail": {"message": "x}", "code": [1, 2]}, "x": 1})";
  ASSERT_TRUE(extract_json_raw_field(json, "detail", out));
  EXPECT_EQ(out, R"({"message": "x}", "code": [1, 2]})");
}

TEST(JsonUtils, RawFieldScalar)
{
  string out;
  ASSERT_TRUE(extract_json_raw_field(R"({"a": 42 , "b": 1})", "a", out));
  EXPECT_EQ(trim(out), "42");
  ASSERT_TRUE(extract_json_raw_field(R"({"b": 1, "a": null})", "a", out));
  EXPECT_EQ(trim(out), "null");
}

TEST(JsonUtils, LooksLikeJsonObject)
{
  EXPECT_TRUE(looks_like_json_object("  {\"a\":1}"));
  EXPECT_FALSE(looks_like_json_object("[1,2]"));
  EXPECT_FALSE(looks_like_json_object("<html>"));
  EXPECT_FALSE(looks_like_json_object(""));
}

TEST(StringUtils, Helpers)
{
  EXPECT_EQ(to_lower("Audio/WebM"), "audio/webm");
  EXPECT_EQ(trim("  x y \n"), "x y");
  EXPECT_TRUE(ends_with("http://h/api/v1", "/api/v1"));
  EXPECT_FALSE(ends_with("v1", "/api/v1"));
  EXPECT_EQ(strip_trailing_slashes("http://h:8000//"), "http://h:8000");
}

}  // namespace
}  // namespace voice_common
