#include <gtest/gtest.h>

#include "courier/net/multipart.hpp"
#include "courier/net/params.hpp"

using namespace courier;
using namespace courier::net;

// --- ParamsTest ---

TEST(ParamsTest, NestedMapsUseBracketNotation) {
  json params = {{"a", {{"b", {{"c", 5}}}}}};
  EXPECT_EQ(encode_params(params), "a[b][c]=5");
}

TEST(ParamsTest, FlatValues) {
  // nlohmann::json 的 object 按 key 排序
  json params = {{"q", "hello world"}, {"n", 10}, {"flag", true}, {"empty", ""}};
  EXPECT_EQ(encode_params(params), "empty=&flag=true&n=10&q=hello%20world");
}

TEST(ParamsTest, ArraysRepeatKey) {
  json params = {{"id", {1, 2, 3}}};
  EXPECT_EQ(encode_params(params), "id=1&id=2&id=3");
}

TEST(ParamsTest, NullIsBareKey) {
  json params = {{"debug", nullptr}};
  EXPECT_EQ(encode_params(params), "debug");
}

TEST(ParamsTest, KeysAndValuesAreEscaped) {
  json params = {{"a&b", {{"c=d", "x/y"}}}};
  EXPECT_EQ(encode_params(params), "a%26b[c%3Dd]=x%2Fy");
}

TEST(ParamsTest, NonObjectEncodesNothing) {
  EXPECT_EQ(encode_params(json()), "");
  EXPECT_EQ(encode_params(json::array({1, 2})), "");
}

TEST(ParamsTest, AppendQueryKeepsExisting) {
  auto url = Url::parse("http://example.com/search?lang=en");
  ASSERT_TRUE(url.has_value());
  append_query(*url, {{"q", "c++"}});
  EXPECT_EQ(url->target(), "/search?lang=en&q=c%2B%2B");

  auto bare = Url::parse("http://example.com/");
  append_query(*bare, {{"a", {{"b", 1}}}});
  EXPECT_EQ(bare->target(), "/?a[b]=1");
}

// --- MultipartTest ---

TEST(MultipartTest, EncodesPartsInOrder) {
  std::vector<Part> parts;
  parts.push_back(Part{"title", "hello", std::nullopt, std::nullopt});
  parts.push_back(Part{"file", "BINARY", std::string("a.bin"), std::nullopt});
  parts.push_back(Part{"meta", "{}", std::nullopt, std::string("application/json")});

  auto body = encode_multipart(parts, "XYZ");
  EXPECT_EQ(body,
            "--XYZ\r\n"
            "Content-Disposition: form-data; name=\"title\"\r\n"
            "\r\n"
            "hello\r\n"
            "--XYZ\r\n"
            "Content-Disposition: form-data; name=\"file\"; filename=\"a.bin\"\r\n"
            "Content-Type: application/octet-stream\r\n"
            "\r\n"
            "BINARY\r\n"
            "--XYZ\r\n"
            "Content-Disposition: form-data; name=\"meta\"\r\n"
            "Content-Type: application/json\r\n"
            "\r\n"
            "{}\r\n"
            "--XYZ--\r\n");
}

TEST(MultipartTest, BoundaryIsRandom) {
  auto a = make_boundary();
  auto b = make_boundary();
  EXPECT_NE(a, b);
  EXPECT_EQ(a.rfind("----courier", 0), 0u);
  EXPECT_EQ(multipart_content_type(a), "multipart/form-data; boundary=" + a);
}
