#include <gtest/gtest.h>

#include "http/response_parser.hpp"

using namespace courier::http;
using FeedResult = ResponseParser::FeedResult;

namespace {

// 逐字节喂给解析器，验证任意切分都能正确解析
FeedResult feed_bytewise(ResponseParser& parser, const std::string& data) {
  FeedResult result = FeedResult::NeedMore;
  for (char c : data) {
    result = parser.feed(&c, 1);
    if (result != FeedResult::NeedMore) break;
  }
  return result;
}

struct Collected {
  std::string body;
  int headers_calls = 0;
};

void collect(ResponseParser& parser, Collected& out) {
  parser.on_headers([&out] {
    ++out.headers_calls;
    return true;
  });
  parser.on_body([&out](const char* data, size_t size) {
    out.body.append(data, size);
    return true;
  });
}

}  // namespace

TEST(ResponseParserTest, ContentLengthBody) {
  ResponseParser parser;
  Collected out;
  collect(parser, out);

  auto result = parser.feed("HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\nContent-Length: 5\r\n\r\nhello");
  EXPECT_EQ(result, FeedResult::Complete);
  EXPECT_EQ(parser.status(), 200);
  EXPECT_EQ(parser.reason(), "OK");
  EXPECT_EQ(parser.headers().get("content-type").value_or(""), "text/plain");
  EXPECT_EQ(parser.content_length(), 5);
  EXPECT_EQ(out.body, "hello");
  EXPECT_EQ(out.headers_calls, 1);
  EXPECT_TRUE(parser.keep_alive());
}

TEST(ResponseParserTest, ByteAtATime) {
  ResponseParser parser;
  Collected out;
  collect(parser, out);

  std::string raw =
      "HTTP/1.1 201 Created\r\n"
      "Transfer-Encoding: chunked\r\n"
      "\r\n"
      "4\r\nWiki\r\n"
      "5;ext=1\r\npedia\r\n"
      "0\r\n"
      "X-Checksum: abc\r\n"
      "\r\n";
  EXPECT_EQ(feed_bytewise(parser, raw), FeedResult::Complete);
  EXPECT_EQ(parser.status(), 201);
  EXPECT_TRUE(parser.chunked());
  EXPECT_EQ(out.body, "Wikipedia");
  EXPECT_EQ(parser.trailers().get("X-Checksum").value_or(""), "abc");
  EXPECT_TRUE(parser.keep_alive());
}

TEST(ResponseParserTest, SplitAcrossFeeds) {
  ResponseParser parser;
  Collected out;
  collect(parser, out);

  EXPECT_EQ(parser.feed("HTTP/1.1 200 OK\r"), FeedResult::NeedMore);
  EXPECT_EQ(parser.feed("\nContent-Le"), FeedResult::NeedMore);
  EXPECT_EQ(parser.feed("ngth: 3\r\n\r"), FeedResult::NeedMore);
  EXPECT_FALSE(parser.headers_complete());
  EXPECT_EQ(parser.feed("\nab"), FeedResult::NeedMore);
  EXPECT_TRUE(parser.headers_complete());
  EXPECT_EQ(parser.feed("c"), FeedResult::Complete);
  EXPECT_EQ(out.body, "abc");
}

TEST(ResponseParserTest, ReadUntilClose) {
  ResponseParser parser;
  Collected out;
  collect(parser, out);

  EXPECT_EQ(parser.feed("HTTP/1.1 200 OK\r\n\r\npart one "), FeedResult::NeedMore);
  EXPECT_EQ(parser.state(), ResponseParser::State::UntilClose);
  EXPECT_EQ(parser.feed("part two"), FeedResult::NeedMore);
  EXPECT_EQ(parser.finish(), FeedResult::Complete);
  EXPECT_EQ(out.body, "part one part two");
  EXPECT_FALSE(parser.keep_alive());
}

TEST(ResponseParserTest, TruncatedBodyIsError) {
  ResponseParser parser;
  EXPECT_EQ(parser.feed("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort"), FeedResult::NeedMore);
  EXPECT_EQ(parser.finish(), FeedResult::Error);
  EXPECT_FALSE(parser.error().empty());
}

TEST(ResponseParserTest, EofBeforeAnyByte) {
  ResponseParser parser;
  EXPECT_EQ(parser.finish(), FeedResult::Error);
  EXPECT_EQ(parser.bytes_received(), 0u);
}

TEST(ResponseParserTest, NoBodyStatuses) {
  for (int status : {204, 304}) {
    ResponseParser parser;
    auto raw = "HTTP/1.1 " + std::to_string(status) + " X\r\nContent-Length: 100\r\n\r\n";
    EXPECT_EQ(parser.feed(raw), FeedResult::Complete) << status;
    EXPECT_EQ(parser.body_bytes(), 0u);
  }

  // HEAD 请求的响应没有 body，即使带了 Content-Length
  ResponseParser head(true);
  EXPECT_EQ(head.feed("HTTP/1.1 200 OK\r\nContent-Length: 1234\r\n\r\n"), FeedResult::Complete);
  EXPECT_TRUE(head.keep_alive());
}

TEST(ResponseParserTest, SkipsInterimResponses) {
  ResponseParser parser;
  Collected out;
  collect(parser, out);

  auto result = parser.feed(
      "HTTP/1.1 100 Continue\r\n\r\n"
      "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n\r\nok");
  EXPECT_EQ(result, FeedResult::Complete);
  EXPECT_EQ(parser.status(), 200);
  EXPECT_EQ(out.headers_calls, 1);
  EXPECT_EQ(out.body, "ok");
}

TEST(ResponseParserTest, ConflictingContentLength) {
  ResponseParser parser;
  auto result = parser.feed("HTTP/1.1 200 OK\r\nContent-Length: 5\r\nContent-Length: 6\r\n\r\nhello");
  EXPECT_EQ(result, FeedResult::Error);

  // 重复但一致的值是允许的
  ResponseParser same;
  EXPECT_EQ(same.feed("HTTP/1.1 200 OK\r\nContent-Length: 2, 2\r\n\r\nhi"), FeedResult::Complete);
}

TEST(ResponseParserTest, MalformedInput) {
  EXPECT_EQ(ResponseParser().feed("HTTX/1.1 200 OK\r\n"), FeedResult::Error);
  EXPECT_EQ(ResponseParser().feed("HTTP/1.1 2x0 OK\r\n"), FeedResult::Error);
  EXPECT_EQ(ResponseParser().feed("HTTP/1.1 200 OK\r\nNoColonHere\r\n"), FeedResult::Error);
  EXPECT_EQ(ResponseParser().feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n"), FeedResult::Error);
  EXPECT_EQ(ResponseParser().feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n2\r\nabX\r\n"), FeedResult::Error);
}

TEST(ResponseParserTest, HeaderLimit) {
  ResponseParser parser(false, 64);
  std::string raw = "HTTP/1.1 200 OK\r\nX-Big: " + std::string(100, 'a') + "\r\n\r\n";
  EXPECT_EQ(parser.feed(raw), FeedResult::Error);
  EXPECT_NE(parser.error().find("exceeds"), std::string::npos);
}

TEST(ResponseParserTest, ConnectionReuseRules) {
  ResponseParser close;
  close.feed("HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 0\r\n\r\n");
  EXPECT_TRUE(close.complete());
  EXPECT_FALSE(close.keep_alive());

  ResponseParser http10;
  http10.feed("HTTP/1.0 200 OK\r\nContent-Length: 0\r\n\r\n");
  EXPECT_EQ(http10.version_minor(), 0);
  EXPECT_FALSE(http10.keep_alive());

  ResponseParser http10_keep;
  http10_keep.feed("HTTP/1.0 200 OK\r\nConnection: Keep-Alive\r\nContent-Length: 0\r\n\r\n");
  EXPECT_TRUE(http10_keep.keep_alive());
}

TEST(ResponseParserTest, BodySinkCanAbort) {
  ResponseParser parser;
  size_t seen = 0;
  parser.on_body([&seen](const char*, size_t size) {
    seen += size;
    return seen <= 4;
  });
  EXPECT_EQ(parser.feed("HTTP/1.1 200 OK\r\nContent-Length: 8\r\n\r\n1234"), FeedResult::NeedMore);
  EXPECT_EQ(parser.feed("5678"), FeedResult::Aborted);
}
