#include <gtest/gtest.h>

#include "courier/http/redirect.hpp"

using namespace courier;
using namespace courier::http;
using Action = RedirectDecision::Action;

namespace {

Request make_request(const std::string& method, const std::string& url) {
  Request request;
  request.method = method;
  request.url = url;
  request.max_redirects = 5;
  request.follow_redirects = true;
  return request;
}

Headers location(const std::string& value) {
  return Headers{{"Location", value}};
}

}  // namespace

TEST(RedirectTest, RelativeLocationResolved) {
  RedirectHandler handler;
  auto request = make_request("GET", "http://a.com/dir/page");
  auto current = *net::Url::parse(request.url);

  auto decision = handler.next(request, current, 302, location("other"), 0);
  ASSERT_EQ(decision.action, Action::Follow);
  EXPECT_EQ(decision.url.to_string(), "http://a.com/dir/other");
  EXPECT_EQ(decision.request.url, "http://a.com/dir/other");
  EXPECT_EQ(decision.request.method, "GET");
}

TEST(RedirectTest, SeeOtherForcesGet) {
  RedirectHandler handler;
  auto request = make_request("POST", "http://a.com/submit");
  request.body = std::string("data");
  request.headers.add("Content-Type", "text/plain");

  auto decision = handler.next(request, *net::Url::parse(request.url), 303, location("/done"), 0);
  ASSERT_EQ(decision.action, Action::Follow);
  EXPECT_EQ(decision.request.method, "GET");
  EXPECT_TRUE(std::holds_alternative<std::monostate>(decision.request.body));
  EXPECT_FALSE(decision.request.headers.contains("Content-Type"));

  // HEAD 保持 HEAD
  auto head = make_request("HEAD", "http://a.com/x");
  EXPECT_EQ(handler.next(head, *net::Url::parse(head.url), 303, location("/y"), 0).request.method, "HEAD");
}

TEST(RedirectTest, TemporaryAndPermanentPreserveMethod) {
  RedirectHandler handler;
  for (int status : {307, 308}) {
    auto request = make_request("PUT", "http://a.com/r");
    request.body = std::string("keep me");
    auto decision = handler.next(request, *net::Url::parse(request.url), status, location("/s"), 0);
    ASSERT_EQ(decision.action, Action::Follow) << status;
    EXPECT_EQ(decision.request.method, "PUT");
    EXPECT_EQ(std::get<std::string>(decision.request.body), "keep me");
  }
}

TEST(RedirectTest, PostRewriteIsConfigurable) {
  auto request = make_request("POST", "http://a.com/r");
  request.form_params = {{"a", 1}};
  auto current = *net::Url::parse(request.url);

  RedirectHandler rewriting;
  auto decision = rewriting.next(request, current, 301, location("/s"), 0);
  EXPECT_EQ(decision.request.method, "GET");
  EXPECT_TRUE(decision.request.form_params.is_null());

  RedirectPolicy strict;
  strict.rewrite_post_on_301_302 = false;
  RedirectHandler preserving(strict);
  decision = preserving.next(request, current, 302, location("/s"), 0);
  EXPECT_EQ(decision.request.method, "POST");
  EXPECT_FALSE(decision.request.form_params.is_null());
}

TEST(RedirectTest, LimitExceeded) {
  RedirectHandler handler;
  auto request = make_request("GET", "http://a.com/loop");
  request.max_redirects = 2;
  auto current = *net::Url::parse(request.url);

  EXPECT_EQ(handler.next(request, current, 302, location("/loop"), 1).action, Action::Follow);
  EXPECT_EQ(handler.next(request, current, 302, location("/loop"), 2).action, Action::LimitExceeded);

  request.max_redirects = 0;
  EXPECT_EQ(handler.next(request, current, 302, location("/loop"), 0).action, Action::LimitExceeded);
}

TEST(RedirectTest, StopCases) {
  RedirectHandler handler;
  auto request = make_request("GET", "http://a.com/");
  auto current = *net::Url::parse(request.url);

  EXPECT_EQ(handler.next(request, current, 200, location("/x"), 0).action, Action::Stop);
  EXPECT_EQ(handler.next(request, current, 302, Headers{}, 0).action, Action::Stop);
  EXPECT_EQ(handler.next(request, current, 300, location("/x"), 0).action, Action::Stop);

  request.follow_redirects = false;
  EXPECT_EQ(handler.next(request, current, 302, location("/x"), 0).action, Action::Stop);
}

TEST(RedirectTest, StreamedBodyCannotBeReplayed) {
  RedirectHandler handler;
  auto request = make_request("POST", "http://a.com/");
  request.body = BodySource([]() -> std::optional<std::string> { return std::nullopt; });

  auto decision = handler.next(request, *net::Url::parse(request.url), 307, location("/x"), 0);
  EXPECT_EQ(decision.action, Action::Stop);

  // 303 会丢弃 body，所以可以跟随
  EXPECT_EQ(handler.next(request, *net::Url::parse(request.url), 303, location("/x"), 0).action, Action::Follow);
}

TEST(RedirectTest, CrossOriginDropsCredentials) {
  RedirectHandler handler;
  auto request = make_request("GET", "https://a.com/");
  request.headers.add("Authorization", "Bearer secret");
  request.headers.add("Cookie", "sid=1");
  request.headers.add("X-Trace", "t");
  request.oauth_token = "secret";
  request.query_params = {{"page", 2}};

  auto decision = handler.next(request, *net::Url::parse(request.url), 302, location("https://b.com/"), 0);
  ASSERT_EQ(decision.action, Action::Follow);
  EXPECT_FALSE(decision.request.headers.contains("Authorization"));
  EXPECT_FALSE(decision.request.headers.contains("Cookie"));
  EXPECT_TRUE(decision.request.headers.contains("X-Trace"));
  EXPECT_FALSE(decision.request.oauth_token.has_value());
  EXPECT_TRUE(decision.request.query_params.is_null());

  // 同源跳转保留认证信息
  auto same = handler.next(request, *net::Url::parse(request.url), 302, location("/next"), 0);
  EXPECT_TRUE(same.request.headers.contains("Authorization"));
  EXPECT_EQ(same.request.oauth_token.value_or(""), "secret");
}
