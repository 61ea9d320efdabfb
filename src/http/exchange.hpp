#pragma once

#include <array>
#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "courier/core/types.hpp"
#include "courier/http/request.hpp"
#include "http/request_encoder.hpp"
#include "courier/http/response.hpp"
#include "http/response_parser.hpp"
#include "courier/net/connection_pool.hpp"

namespace courier::http {

struct ExchangeSettings {
  net::Url url;  // query params already applied
  net::ConnectOptions connect;
  int64_t timeout_ms = 0;          // whole attempt; 0 = none
  int64_t connect_timeout_ms = 0;  // acquisition only; 0 = covered by timeout_ms
  int64_t keepalive_ms = kKeepaliveDisabled;
  std::string default_charset = "UTF-8";
  size_t max_header_bytes = 65536;

  // In stream mode, responses matching this are buffered instead of handed off
  std::function<bool(int status, const Headers& headers)> is_redirect;

  // Runs once on the strand when the attempt reaches a terminal state. In stream mode this is
  // after the body ended, so later than the completion handler.
  std::function<void()> on_finished;
};

struct ExchangeOutcome {
  Response response;  // status, headers, body, trailers, connection info; or error
  // Reused connection failed before any response byte; safe to retry on a fresh one
  bool stale = false;
};

/**
 * One request/response attempt on one connection.
 *
 * Pending -> Connecting -> Writing -> AwaitingResponse -> ReadingHeaders -> ReadingBody -> Done,
 * with Failed and Cancelled as absorbing states. Every handler runs on the exchange's own strand.
 * The completion handler runs exactly once; in stream mode it runs when the headers are parsed
 * and later failures go to the BodyStream.
 */
class Exchange : public std::enable_shared_from_this<Exchange> {
 public:
  using CompletionHandler = std::function<void(ExchangeOutcome)>;

  static std::shared_ptr<Exchange> create(asio::io_context& io_ctx, std::shared_ptr<net::ConnectionPool> pool, Request request,
                                          ExchangeSettings settings);

  Exchange(const Exchange&) = delete;
  Exchange& operator=(const Exchange&) = delete;

  void start(CompletionHandler handler);

  // Ends the attempt with CancelledError unless it is already terminal
  void cancel();

  ExchangeState state() const {
    return state_.load();
  }

 private:
  Exchange(asio::io_context& io_ctx, std::shared_ptr<net::ConnectionPool> pool, Request request, ExchangeSettings settings);

  void transition(ExchangeState next);

  void arm_timer(asio::steady_timer& timer, int64_t ms, const char* stage);

  void on_acquired(std::optional<Error> error, std::shared_ptr<net::Connection> conn, bool reused);

  void write(const std::string& data, std::function<void()> next);

  void write_next_chunk();

  void read();

  void on_read(const asio::error_code& ec, size_t n);

  bool on_headers();

  bool on_body(const char* data, size_t size);

  void succeed();

  void fail(Error error, ExchangeState terminal = ExchangeState::Failed, bool stale = false);

  void deliver(ExchangeOutcome outcome);

  void notify_finished();

  Response base_response() const;

  net::Strand strand_;
  std::shared_ptr<net::ConnectionPool> pool_;
  Request request_;
  ExchangeSettings settings_;
  CompletionHandler handler_;

  std::atomic<ExchangeState> state_{ExchangeState::Pending};
  asio::steady_timer deadline_;
  asio::steady_timer connect_deadline_;
  std::shared_ptr<net::AcquireTicket> ticket_;
  std::shared_ptr<net::Connection> conn_;
  bool reused_ = false;
  uint64_t connection_id_ = 0;

  EncodedRequest encoded_;
  std::string write_buf_;
  std::array<char, 16384> read_buf_{};
  ResponseParser parser_;

  std::string body_;
  uint64_t received_ = 0;
  bool size_limited_ = false;
  std::shared_ptr<BodyStream> stream_;
  bool delivered_ = false;
};

}  // namespace courier::http
