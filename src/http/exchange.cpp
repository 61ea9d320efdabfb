#include "http/exchange.hpp"

#include <spdlog/spdlog.h>

#include "http/coercion.hpp"
#include "courier/net/connection.hpp"

namespace courier::http {

std::shared_ptr<Exchange> Exchange::create(asio::io_context& io_ctx, std::shared_ptr<net::ConnectionPool> pool, Request request,
                                           ExchangeSettings settings) {
  return std::shared_ptr<Exchange>(new Exchange(io_ctx, std::move(pool), std::move(request), std::move(settings)));
}

Exchange::Exchange(asio::io_context& io_ctx, std::shared_ptr<net::ConnectionPool> pool, Request request, ExchangeSettings settings)
    : strand_(asio::make_strand(io_ctx)),
      pool_(std::move(pool)),
      request_(std::move(request)),
      settings_(std::move(settings)),
      deadline_(io_ctx),
      connect_deadline_(io_ctx),
      parser_(request_.method == "HEAD", settings_.max_header_bytes) {
  parser_.on_headers([this] { return on_headers(); });
  parser_.on_body([this](const char* data, size_t size) { return on_body(data, size); });
}

void Exchange::start(CompletionHandler handler) {
  handler_ = std::move(handler);
  auto self = shared_from_this();

  asio::dispatch(strand_, [self] {
    if (is_terminal(self->state())) return;
    self->transition(ExchangeState::Connecting);

    if (self->settings_.timeout_ms > 0) {
      self->arm_timer(self->deadline_, self->settings_.timeout_ms, "request");
    }
    if (self->settings_.connect_timeout_ms > 0) {
      self->arm_timer(self->connect_deadline_, self->settings_.connect_timeout_ms, "connect");
    }

    self->ticket_ = self->pool_->acquire(self->settings_.url, self->settings_.connect, self->strand_,
                                         [self](std::optional<Error> error, std::shared_ptr<net::Connection> conn, bool reused) {
                                           self->on_acquired(std::move(error), std::move(conn), reused);
                                         });
  });
}

void Exchange::cancel() {
  auto self = shared_from_this();
  asio::post(strand_, [self] { self->fail(make_error(ErrorKind::CancelledError, "request cancelled"), ExchangeState::Cancelled); });
}

void Exchange::transition(ExchangeState next) {
  spdlog::trace("exchange {} {}: {} -> {}", request_.method, settings_.url.to_string(), to_string(state_.load()), to_string(next));
  state_ = next;
}

void Exchange::arm_timer(asio::steady_timer& timer, int64_t ms, const char* stage) {
  auto self = shared_from_this();
  timer.expires_after(Millis(ms));
  timer.async_wait(asio::bind_executor(strand_, [self, ms, stage](const asio::error_code& ec) {
    if (ec || is_terminal(self->state())) return;
    spdlog::warn("{} {} {} timeout after {} ms (state {})", self->request_.method, self->settings_.url.to_string(), stage, ms,
                 to_string(self->state()));
    self->fail(make_error(ErrorKind::TimeoutError, std::string(stage) + " timed out after " + std::to_string(ms) + " ms"),
               ExchangeState::Cancelled);
  }));
}

void Exchange::on_acquired(std::optional<Error> error, std::shared_ptr<net::Connection> conn, bool reused) {
  if (is_terminal(state())) {
    if (conn) pool_->discard(conn);
    return;
  }
  if (error) {
    fail(*error);
    return;
  }

  connect_deadline_.cancel();
  conn_ = std::move(conn);
  reused_ = reused;
  connection_id_ = conn_->id();
  conn_->count_request();

  EncodeOptions options;
  options.keep_alive = settings_.keepalive_ms > 0;
  if (settings_.connect.proxy && !settings_.url.is_https()) {
    // Plain HTTP goes through the proxy in absolute form, HTTPS was tunnelled by the connector
    options.absolute_form = true;
    if (!settings_.connect.proxy->userinfo.empty()) {
      options.proxy_authorization = net::basic_credentials_from_userinfo(settings_.connect.proxy->userinfo);
    }
  }
  encoded_ = RequestEncoder::encode(request_, settings_.url, options);

  transition(ExchangeState::Writing);
  auto self = shared_from_this();
  write(encoded_.head + encoded_.body, [self] {
    if (self->encoded_.source) {
      self->write_next_chunk();
      return;
    }
    self->transition(ExchangeState::AwaitingResponse);
    self->read();
  });
}

void Exchange::write(const std::string& data, std::function<void()> next) {
  write_buf_ = data;
  auto self = shared_from_this();
  conn_->transport().async_write(strand_, asio::buffer(write_buf_), [self, next = std::move(next)](const asio::error_code& ec, size_t) {
    if (is_terminal(self->state())) return;
    if (ec) {
      if (self->reused_) {
        spdlog::warn("write on reused connection #{} failed: {}", self->connection_id_, ec.message());
        self->fail(make_error(ErrorKind::ConnectError, "stale connection: " + ec.message()), ExchangeState::Failed, true);
      } else {
        self->fail(make_error(ErrorKind::ConnectError, "write failed: " + ec.message()));
      }
      return;
    }
    self->conn_->touch();
    next();
  });
}

void Exchange::write_next_chunk() {
  std::optional<std::string> chunk;
  try {
    do {
      chunk = encoded_.source();
    } while (chunk && chunk->empty());
  } catch (const std::exception& e) {
    fail(make_error(ErrorKind::InvalidRequest, std::string("body source failed: ") + e.what()));
    return;
  }

  auto self = shared_from_this();
  if (!chunk) {
    write(RequestEncoder::encode_chunk(""), [self] {
      self->transition(ExchangeState::AwaitingResponse);
      self->read();
    });
    return;
  }
  write(RequestEncoder::encode_chunk(*chunk), [self] { self->write_next_chunk(); });
}

void Exchange::read() {
  auto self = shared_from_this();
  conn_->transport().async_read_some(strand_, asio::buffer(read_buf_),
                                     [self](const asio::error_code& ec, size_t n) { self->on_read(ec, n); });
}

void Exchange::on_read(const asio::error_code& ec, size_t n) {
  if (is_terminal(state())) return;

  if (n > 0) {
    conn_->touch();
    if (state() == ExchangeState::AwaitingResponse) {
      transition(ExchangeState::ReadingHeaders);
    }

    switch (parser_.feed(read_buf_.data(), n)) {
      case ResponseParser::FeedResult::Complete:
        succeed();
        return;
      case ResponseParser::FeedResult::Aborted:
        if (size_limited_) {
          fail(make_error(ErrorKind::SizeLimitError, "response body rejected by filter after " + std::to_string(received_) + " bytes"));
        } else {
          fail(make_error(ErrorKind::ProtocolError, "response processing aborted"));
        }
        return;
      case ResponseParser::FeedResult::Error:
        spdlog::warn("protocol error from {}: {}", settings_.url.to_string(), parser_.error());
        fail(make_error(ErrorKind::ProtocolError, parser_.error()));
        return;
      case ResponseParser::FeedResult::NeedMore:
        break;
    }
  }

  if (!ec) {
    read();
    return;
  }

  bool nothing_received = parser_.bytes_received() == 0;
  if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
    if (parser_.finish() == ResponseParser::FeedResult::Complete) {
      succeed();
      return;
    }
    if (reused_ && nothing_received) {
      spdlog::warn("reused connection #{} closed by peer before responding", connection_id_);
      fail(make_error(ErrorKind::ConnectError, "stale connection: closed by peer"), ExchangeState::Failed, true);
      return;
    }
    spdlog::warn("protocol error from {}: {}", settings_.url.to_string(), parser_.error());
    fail(make_error(ErrorKind::ProtocolError, parser_.error()));
    return;
  }

  if (reused_ && nothing_received) {
    spdlog::warn("read on reused connection #{} failed: {}", connection_id_, ec.message());
    fail(make_error(ErrorKind::ConnectError, "stale connection: " + ec.message()), ExchangeState::Failed, true);
    return;
  }
  fail(make_error(ErrorKind::ConnectError, "read failed: " + ec.message()));
}

bool Exchange::on_headers() {
  transition(ExchangeState::ReadingBody);

  if (request_.as != Coercion::Stream) return true;
  if (settings_.is_redirect && settings_.is_redirect(parser_.status(), parser_.headers())) return true;

  stream_ = std::make_shared<BodyStream>();
  std::weak_ptr<Exchange> weak = shared_from_this();
  stream_->set_canceller([weak] {
    if (auto self = weak.lock()) self->cancel();
  });
  ExchangeOutcome outcome;
  outcome.response = base_response();
  outcome.response.body.kind = Body::Kind::Stream;
  outcome.response.body.stream = stream_;
  deliver(std::move(outcome));
  return true;
}

bool Exchange::on_body(const char* data, size_t size) {
  received_ += size;
  if (request_.filter && !request_.filter(received_)) {
    size_limited_ = true;
    return false;
  }
  if (stream_) {
    stream_->push(std::string(data, size));
  } else {
    body_.append(data, size);
  }
  return true;
}

void Exchange::succeed() {
  transition(ExchangeState::Done);
  deadline_.cancel();
  connect_deadline_.cancel();

  bool reusable = parser_.keep_alive() && settings_.keepalive_ms > 0;
  pool_->release(conn_, reusable ? settings_.keepalive_ms : kKeepaliveDisabled);
  conn_.reset();

  if (stream_) {
    stream_->finish();
    notify_finished();
    return;
  }

  ExchangeOutcome outcome;
  outcome.response = base_response();
  outcome.response.trailers = parser_.trailers();
  auto mode = request_.as == Coercion::Stream ? Coercion::Bytes : request_.as;
  outcome.response.body = coerce(std::move(body_), mode, parser_.headers().get_or("Content-Type", ""), settings_.default_charset);
  deliver(std::move(outcome));
  notify_finished();
}

void Exchange::fail(Error error, ExchangeState terminal, bool stale) {
  if (is_terminal(state())) return;
  transition(terminal);
  deadline_.cancel();
  connect_deadline_.cancel();

  if (ticket_) ticket_->cancel();
  if (conn_) {
    pool_->discard(conn_);
    conn_.reset();
  }

  if (stream_ && delivered_) {
    stream_->fail(std::move(error));
    notify_finished();
    return;
  }

  ExchangeOutcome outcome;
  outcome.response = base_response();
  outcome.response.error = std::move(error);
  outcome.stale = stale;
  deliver(std::move(outcome));
  notify_finished();
}

void Exchange::deliver(ExchangeOutcome outcome) {
  if (delivered_) return;
  delivered_ = true;
  auto handler = std::move(handler_);
  handler_ = nullptr;
  if (handler) handler(std::move(outcome));
}

void Exchange::notify_finished() {
  auto on_finished = std::move(settings_.on_finished);
  settings_.on_finished = nullptr;
  if (on_finished) on_finished();
}

Response Exchange::base_response() const {
  Response response;
  response.status = parser_.status();
  response.headers = parser_.headers();
  response.url = settings_.url.to_string();
  response.connection_reused = reused_;
  response.connection_id = connection_id_;
  return response;
}

}  // namespace courier::http
