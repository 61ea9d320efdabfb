#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "courier/core/types.hpp"

namespace courier::net {

using Strand = asio::strand<asio::io_context::executor_type>;

using IoHandler = std::function<void(const asio::error_code&, size_t)>;

// Byte stream under one Connection. Completion handlers run on the given strand.
class Transport {
 public:
  virtual ~Transport() = default;

  // Writes the whole buffer; the buffer must outlive the operation
  virtual void async_write(const Strand& strand, asio::const_buffer data, IoHandler handler) = 0;

  virtual void async_read_some(const Strand& strand, asio::mutable_buffer buffer, IoHandler handler) = 0;

  // Idempotent; pending operations complete with asio::error::operation_aborted
  virtual void close() = 0;

  virtual bool is_open() const = 0;

  virtual bool is_secure() const = 0;
};

class TcpTransport : public Transport {
 public:
  explicit TcpTransport(asio::ip::tcp::socket socket) : socket_(std::move(socket)) {}

  void async_write(const Strand& strand, asio::const_buffer data, IoHandler handler) override;

  void async_read_some(const Strand& strand, asio::mutable_buffer buffer, IoHandler handler) override;

  void close() override;

  bool is_open() const override {
    return socket_.is_open();
  }

  bool is_secure() const override {
    return false;
  }

 private:
  asio::ip::tcp::socket socket_;
};

class TlsTransport : public Transport {
 public:
  using Stream = asio::ssl::stream<asio::ip::tcp::socket>;

  explicit TlsTransport(std::unique_ptr<Stream> stream) : stream_(std::move(stream)) {}

  void async_write(const Strand& strand, asio::const_buffer data, IoHandler handler) override;

  void async_read_some(const Strand& strand, asio::mutable_buffer buffer, IoHandler handler) override;

  void close() override;

  bool is_open() const override {
    return stream_->lowest_layer().is_open();
  }

  bool is_secure() const override {
    return true;
  }

 private:
  std::unique_ptr<Stream> stream_;
};

// In-memory transport replaying scripted raw responses; used by the pool interceptor.
// Response N becomes readable after the request N write. Written bytes are recorded.
class CannedTransport : public Transport {
 public:
  CannedTransport(asio::io_context& io_ctx, std::vector<std::string> responses, Millis delay = Millis(0));

  ~CannedTransport() override;

  static std::unique_ptr<CannedTransport> from_response(asio::io_context& io_ctx, std::string raw, Millis delay = Millis(0));

  void async_write(const Strand& strand, asio::const_buffer data, IoHandler handler) override;

  void async_read_some(const Strand& strand, asio::mutable_buffer buffer, IoHandler handler) override;

  void close() override;

  // Open while unread response bytes or unreleased responses remain
  bool is_open() const override;

  bool is_secure() const override {
    return false;
  }

  // Shared so callers can inspect it after the transport moved into a Connection
  std::shared_ptr<std::string> written() const {
    return written_;
  }

 private:
  struct State {
    std::deque<std::string> pending;
    std::string readable;
    bool released = false;
    std::atomic<bool> closed{false};
  };

  asio::steady_timer timer_;
  Millis delay_;
  std::shared_ptr<State> state_ = std::make_shared<State>();
  std::shared_ptr<std::string> written_ = std::make_shared<std::string>();
};

}  // namespace courier::net
