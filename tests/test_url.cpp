#include <gtest/gtest.h>

#include "courier/net/headers.hpp"
#include "courier/net/url.hpp"

using namespace courier::net;

// --- UrlTest ---

TEST(UrlTest, ParseFull) {
  auto url = Url::parse("HTTPS://user:pw@Example.COM:8443/a/b?x=1#frag");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->scheme, "https");
  EXPECT_EQ(url->userinfo, "user:pw");
  EXPECT_EQ(url->host, "example.com");
  EXPECT_EQ(url->port, 8443);
  EXPECT_EQ(url->path, "/a/b");
  EXPECT_EQ(url->query, "x=1");
  EXPECT_EQ(url->target(), "/a/b?x=1");
  EXPECT_EQ(url->authority(), "example.com:8443");
}

TEST(UrlTest, DefaultPortsAndPath) {
  auto url = Url::parse("http://example.com");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->port_or_default(), 80);
  EXPECT_EQ(url->path, "/");
  EXPECT_EQ(url->authority(), "example.com");

  auto secure = Url::parse("https://example.com:443/");
  ASSERT_TRUE(secure.has_value());
  EXPECT_EQ(secure->port_or_default(), 443);
  EXPECT_EQ(secure->authority(), "example.com");
}

TEST(UrlTest, Ipv6Literal) {
  auto url = Url::parse("http://[::1]:8080/x");
  ASSERT_TRUE(url.has_value());
  EXPECT_EQ(url->host, "::1");
  EXPECT_EQ(url->port, 8080);
  EXPECT_EQ(url->authority(), "[::1]:8080");
}

TEST(UrlTest, RejectsUnsupported) {
  EXPECT_FALSE(Url::parse("ftp://example.com/").has_value());
  EXPECT_FALSE(Url::parse("example.com/path").has_value());
  EXPECT_FALSE(Url::parse("http://:80/").has_value());
  EXPECT_FALSE(Url::parse("http://host:99999/").has_value());
}

TEST(UrlTest, ResolveReferences) {
  auto base = Url::parse("http://a.com/b/c/d?q=1");
  ASSERT_TRUE(base.has_value());

  EXPECT_EQ(Url::resolve(*base, "https://other.org/x")->to_string(), "https://other.org/x");
  EXPECT_EQ(Url::resolve(*base, "//cdn.com/y")->to_string(), "http://cdn.com/y");
  EXPECT_EQ(Url::resolve(*base, "/abs")->to_string(), "http://a.com/abs");
  EXPECT_EQ(Url::resolve(*base, "e")->to_string(), "http://a.com/b/c/e");
  EXPECT_EQ(Url::resolve(*base, "../e")->to_string(), "http://a.com/b/e");
  EXPECT_EQ(Url::resolve(*base, "./e/../f")->to_string(), "http://a.com/b/c/f");
  EXPECT_EQ(Url::resolve(*base, "?z=2")->to_string(), "http://a.com/b/c/d?z=2");
}

TEST(UrlTest, ResolveEncodesRawCharacters) {
  auto base = Url::parse("http://a.com/b/c");
  ASSERT_TRUE(base.has_value());

  // 服务器常在 Location 中直接写空格和 UTF-8
  auto spaced = Url::resolve(*base, "/a b");
  ASSERT_TRUE(spaced.has_value());
  EXPECT_EQ(spaced->to_string(), "http://a.com/a%20b");

  auto relative = Url::resolve(*base, "d e?q=x y");
  ASSERT_TRUE(relative.has_value());
  EXPECT_EQ(relative->target(), "/b/d%20e?q=x%20y");

  auto utf8 = Url::resolve(*base, "/caf\xC3\xA9");
  ASSERT_TRUE(utf8.has_value());
  EXPECT_EQ(utf8->path, "/caf%C3%A9");

  auto absolute = Url::resolve(*base, "http://other.org/x y|z");
  ASSERT_TRUE(absolute.has_value());
  EXPECT_EQ(absolute->target(), "/x%20y%7Cz");

  // 已有的转义保持不变
  EXPECT_EQ(Url::resolve(*base, "/a%20b%zz")->path, "/a%20b%25zz");
}

TEST(UrlTest, PercentEncoding) {
  EXPECT_EQ(percent_encode("a b&c=d/é"), "a%20b%26c%3Dd%2F%C3%A9");
  EXPECT_EQ(percent_encode("safe-_.~"), "safe-_.~");
  EXPECT_EQ(percent_decode("a%20b%2fc"), "a b/c");
  EXPECT_EQ(percent_decode("bad%2"), "bad%2");
}

TEST(UrlTest, ConnectionKeyIdentity) {
  auto a = ConnectionKey::from_url(*Url::parse("http://Example.com/x"));
  auto b = ConnectionKey::from_url(*Url::parse("http://example.com:80/y"));
  EXPECT_EQ(a, b);

  auto proxied = ConnectionKey::from_url(*Url::parse("http://example.com/"), "http://proxy:3128");
  EXPECT_NE(a, proxied);

  // insecure 只对 https 生效
  auto insecure_http = ConnectionKey::from_url(*Url::parse("http://example.com/"), "", true);
  EXPECT_EQ(a, insecure_http);
  auto secure = ConnectionKey::from_url(*Url::parse("https://example.com/"));
  auto insecure = ConnectionKey::from_url(*Url::parse("https://example.com/"), "", true);
  EXPECT_NE(secure, insecure);
}

// --- HeadersTest ---

TEST(HeadersTest, NameAndValueValidation) {
  EXPECT_TRUE(valid_header_name("X-Request-Id"));
  EXPECT_TRUE(valid_header_name("x_custom.1"));
  EXPECT_FALSE(valid_header_name(""));
  EXPECT_FALSE(valid_header_name("X Id"));
  EXPECT_FALSE(valid_header_name("X-Id:"));
  EXPECT_FALSE(valid_header_name("X-Id\r\n"));

  EXPECT_TRUE(valid_header_value("text/plain; charset=utf-8"));
  EXPECT_TRUE(valid_header_value(""));
  EXPECT_FALSE(valid_header_value("a\r\nHost: evil.example"));
  EXPECT_FALSE(valid_header_value("a\nb"));
  EXPECT_FALSE(valid_header_value(std::string("a\0b", 3)));
}

TEST(HeadersTest, CaseInsensitiveLookup) {
  Headers headers{{"Content-Type", "text/plain"}};
  EXPECT_TRUE(headers.contains("content-type"));
  EXPECT_EQ(headers.get("CONTENT-TYPE").value_or(""), "text/plain");
  EXPECT_FALSE(headers.get("Accept").has_value());
  EXPECT_EQ(headers.get_or("Accept", "*/*"), "*/*");
}

TEST(HeadersTest, MultiValuesKeepOrder) {
  Headers headers;
  headers.add("Set-Cookie", "a=1");
  headers.add("X-Other", "x");
  headers.add("set-cookie", "b=2");

  auto cookies = headers.get_all("Set-Cookie");
  ASSERT_EQ(cookies.size(), 2u);
  EXPECT_EQ(cookies[0], "a=1");
  EXPECT_EQ(cookies[1], "b=2");
  EXPECT_EQ(headers.to_map()["set-cookie"], "a=1, b=2");
}

TEST(HeadersTest, SetReplacesAll) {
  Headers headers;
  headers.add("Accept", "a");
  headers.add("Accept", "b");
  headers.set("accept", "c");

  EXPECT_EQ(headers.get_all("Accept").size(), 1u);
  EXPECT_EQ(headers.get("Accept").value_or(""), "c");
  EXPECT_EQ(headers.remove("ACCEPT"), 1u);
  EXPECT_TRUE(headers.empty());
}
