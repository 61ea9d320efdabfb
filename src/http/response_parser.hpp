#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "courier/net/headers.hpp"

namespace courier::http {

using net::Headers;

/**
 * Incremental HTTP/1.x response parser.
 *
 * feed() consumes whatever bytes are available and never waits for more; status line,
 * header lines, chunk-size lines and CRLFs may be split at any byte. Body bytes go to the
 * body sink as they arrive. Interim 1xx responses are skipped.
 */
class ResponseParser {
 public:
  enum class State {
    StatusLine,
    Headers,
    Body,  // Content-Length framed
    ChunkSize,
    ChunkData,
    ChunkDataCrlf,
    Trailers,
    UntilClose,
    Complete,
    Error
  };

  enum class FeedResult {
    NeedMore,
    Complete,
    Aborted,  // a callback returned false
    Error
  };

  // Called once the final (non-1xx) header block is parsed; returning false aborts
  using HeadersCallback = std::function<bool()>;

  // Returning false aborts
  using BodySink = std::function<bool(const char* data, size_t size)>;

  explicit ResponseParser(bool head_request = false, size_t max_header_bytes = 65536)
      : head_request_(head_request), max_header_bytes_(max_header_bytes) {}

  void on_headers(HeadersCallback callback) {
    on_headers_ = std::move(callback);
  }

  void on_body(BodySink sink) {
    on_body_ = std::move(sink);
  }

  FeedResult feed(const char* data, size_t size);

  FeedResult feed(const std::string& data) {
    return feed(data.data(), data.size());
  }

  // Signals EOF. Completes an until-close body; anything else unfinished is an error.
  FeedResult finish();

  State state() const {
    return state_;
  }

  bool headers_complete() const {
    return headers_done_;
  }

  bool complete() const {
    return state_ == State::Complete;
  }

  int status() const {
    return status_;
  }

  const std::string& reason() const {
    return reason_;
  }

  // 0 for HTTP/1.0, 1 for HTTP/1.1
  int version_minor() const {
    return version_minor_;
  }

  const Headers& headers() const {
    return headers_;
  }

  const Headers& trailers() const {
    return trailers_;
  }

  // Whether the connection may carry another request after this response
  bool keep_alive() const;

  bool chunked() const {
    return chunked_;
  }

  // Content-Length when the body is length framed, -1 otherwise
  int64_t content_length() const {
    return content_length_;
  }

  uint64_t bytes_received() const {
    return bytes_received_;
  }

  uint64_t body_bytes() const {
    return body_bytes_;
  }

  const std::string& error() const {
    return error_;
  }

 private:
  bool take_line(const char* data, size_t size, size_t& pos, std::string& line);

  bool handle_status_line(const std::string& line);

  bool handle_header_line(const std::string& line, Headers& target);

  bool end_of_headers();

  bool handle_chunk_size(const std::string& line);

  bool deliver(const char* data, size_t size);

  bool fail(std::string message);

  bool head_request_;
  size_t max_header_bytes_;
  HeadersCallback on_headers_;
  BodySink on_body_;

  State state_ = State::StatusLine;
  bool aborted_ = false;
  std::string line_;
  size_t header_bytes_ = 0;
  bool headers_done_ = false;

  int status_ = 0;
  int version_minor_ = 1;
  std::string reason_;
  Headers headers_;
  Headers trailers_;

  bool chunked_ = false;
  int64_t content_length_ = -1;
  uint64_t remaining_ = 0;

  uint64_t bytes_received_ = 0;
  uint64_t body_bytes_ = 0;
  std::string error_;
};

std::string to_string(ResponseParser::State state);

}  // namespace courier::http
