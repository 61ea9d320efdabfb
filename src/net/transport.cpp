#include "courier/net/transport.hpp"

#include <algorithm>
#include <cstring>

namespace courier::net {

void TcpTransport::async_write(const Strand& strand, asio::const_buffer data, IoHandler handler) {
  asio::async_write(socket_, data, asio::bind_executor(strand, std::move(handler)));
}

void TcpTransport::async_read_some(const Strand& strand, asio::mutable_buffer buffer, IoHandler handler) {
  socket_.async_read_some(buffer, asio::bind_executor(strand, std::move(handler)));
}

void TcpTransport::close() {
  asio::error_code ignored;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
  socket_.close(ignored);
}

void TlsTransport::async_write(const Strand& strand, asio::const_buffer data, IoHandler handler) {
  asio::async_write(*stream_, data, asio::bind_executor(strand, std::move(handler)));
}

void TlsTransport::async_read_some(const Strand& strand, asio::mutable_buffer buffer, IoHandler handler) {
  stream_->async_read_some(buffer, asio::bind_executor(strand, std::move(handler)));
}

void TlsTransport::close() {
  // No close_notify round trip; the framing state is either complete or untrusted
  asio::error_code ignored;
  stream_->lowest_layer().close(ignored);
}

CannedTransport::CannedTransport(asio::io_context& io_ctx, std::vector<std::string> responses, Millis delay)
    : timer_(io_ctx), delay_(delay) {
  state_->pending.assign(responses.begin(), responses.end());
}

CannedTransport::~CannedTransport() {
  close();
}

std::unique_ptr<CannedTransport> CannedTransport::from_response(asio::io_context& io_ctx, std::string raw, Millis delay) {
  std::vector<std::string> responses;
  responses.push_back(std::move(raw));
  return std::make_unique<CannedTransport>(io_ctx, std::move(responses), delay);
}

void CannedTransport::async_write(const Strand& strand, asio::const_buffer data, IoHandler handler) {
  if (state_->closed) {
    asio::post(strand, [handler = std::move(handler)] { handler(asio::error::operation_aborted, 0); });
    return;
  }

  written_->append(static_cast<const char*>(data.data()), data.size());
  if (state_->readable.empty() && !state_->pending.empty()) {
    state_->readable = std::move(state_->pending.front());
    state_->pending.pop_front();
    state_->released = false;
  }

  size_t n = data.size();
  asio::post(strand, [handler = std::move(handler), n] { handler(asio::error_code(), n); });
}

void CannedTransport::async_read_some(const Strand& strand, asio::mutable_buffer buffer, IoHandler handler) {
  if (state_->closed) {
    asio::post(strand, [handler = std::move(handler)] { handler(asio::error::operation_aborted, 0); });
    return;
  }

  // Holds the state, not the transport: the transport may be destroyed before this runs
  auto deliver = [state = state_, buffer, handler = std::move(handler)](const asio::error_code& ec) {
    if (ec || state->closed) {
      handler(asio::error::operation_aborted, 0);
      return;
    }
    if (state->readable.empty()) {
      handler(asio::error::eof, 0);
      return;
    }
    size_t n = std::min(buffer.size(), state->readable.size());
    std::memcpy(buffer.data(), state->readable.data(), n);
    state->readable.erase(0, n);
    handler(asio::error_code(), n);
  };

  // The configured delay applies once per response, before its first byte
  if (delay_.count() > 0 && !state_->released && !state_->readable.empty()) {
    state_->released = true;
    timer_.expires_after(delay_);
    timer_.async_wait(asio::bind_executor(strand, std::move(deliver)));
    return;
  }
  state_->released = true;
  asio::post(strand, [deliver = std::move(deliver)]() mutable { deliver(asio::error_code()); });
}

void CannedTransport::close() {
  state_->closed = true;
  timer_.cancel();
}

bool CannedTransport::is_open() const {
  return !state_->closed && (!state_->readable.empty() || !state_->pending.empty());
}

}  // namespace courier::net
