#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "courier/core/types.hpp"
#include "courier/http/request.hpp"
#include "courier/net/headers.hpp"

namespace courier::http {

// Response body handed out before the body is read (Coercion::Stream).
// The exchange pushes chunks; consumers pull with read() or subscribe with on_data().
class BodyStream {
 public:
  using ChunkCallback = std::function<void(const std::string& chunk)>;
  using EndCallback = std::function<void(const std::optional<Error>& error)>;

  // Blocks for the next chunk; returns false at the end of the body or on error
  bool read(std::string& chunk);

  // Drains the remaining body (blocking)
  std::string read_all();

  // Push mode. Buffered chunks are replayed first; callbacks run on the producer thread.
  void on_data(ChunkCallback on_chunk, EndCallback on_end);

  bool finished() const;

  std::optional<Error> error() const;

  // Stops the transfer: the connection is closed and the stream ends with CancelledError.
  // No effect once the body has ended.
  void cancel();

  // Producer side
  void set_canceller(std::function<void()> canceller);

  void push(std::string chunk);

  void finish();

  void fail(Error error);

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> chunks_;
  bool finished_ = false;
  std::optional<Error> error_;
  ChunkCallback on_chunk_;
  EndCallback on_end_;
  std::function<void()> canceller_;
};

struct Body {
  enum class Kind { None, Bytes, Text, Stream };

  Kind kind = Kind::None;
  std::string data;          // raw bytes, or UTF-8 text for Kind::Text
  std::string charset;       // charset the text was decoded from
  std::string decode_error;  // why text was requested but bytes were delivered
  std::shared_ptr<BodyStream> stream;

  bool empty() const {
    return kind == Kind::None || (kind != Kind::Stream && data.empty());
  }
};

struct Response {
  int status = 0;
  Headers headers;
  Body body;
  std::optional<Error> error;

  Request opts;                        // effective request options as submitted
  std::string url;                     // final URL after redirects
  std::vector<std::string> redirects;  // URLs visited after the original one
  Headers trailers;                    // chunked trailers

  bool connection_reused = false;
  uint64_t connection_id = 0;

  // Check error first: exactly one of body/error is meaningful
  bool failed() const {
    return error.has_value();
  }

  bool ok() const {
    return !error && status >= 200 && status < 300;
  }

  const std::string& text() const {
    return body.data;
  }

  static Response failure(Error error) {
    Response response;
    response.error = std::move(error);
    return response;
  }
};

}  // namespace courier::http
