#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "courier/core/types.hpp"
#include "courier/net/transport.hpp"
#include "courier/net/url.hpp"

namespace courier::net {

// One socket bound to a ConnectionKey. At most one exchange uses it at a time.
class Connection {
 public:
  Connection(ConnectionKey key, std::unique_ptr<Transport> transport);

  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  uint64_t id() const {
    return id_;
  }

  const ConnectionKey& key() const {
    return key_;
  }

  Transport& transport() {
    return *transport_;
  }

  ConnectionState state() const {
    return state_.load();
  }

  bool is_open() const;

  void mark_in_use();

  void mark_idle(TimePoint expires_at);

  void close();

  void touch() {
    last_activity_ = Clock::now();
  }

  TimePoint last_activity() const {
    return last_activity_;
  }

  TimePoint expires_at() const {
    return expires_at_;
  }

  bool expired(TimePoint now) const {
    return now >= expires_at_;
  }

  size_t requests_served() const {
    return requests_served_;
  }

  void count_request() {
    ++requests_served_;
  }

 private:
  static std::atomic<uint64_t> next_id_;

  uint64_t id_;
  ConnectionKey key_;
  std::unique_ptr<Transport> transport_;
  std::atomic<ConnectionState> state_{ConnectionState::InUse};
  TimePoint last_activity_ = Clock::now();
  TimePoint expires_at_ = TimePoint::max();
  size_t requests_served_ = 0;
};

struct ConnectOptions {
  std::optional<Url> proxy;  // userinfo, if any, becomes Proxy-Authorization
  bool insecure = false;     // skip peer and host name verification
  bool fresh_only = false;   // never hand out an idle connection
};

// In-flight establishment (resolve, connect, proxy tunnel, TLS handshake)
class ConnectAttempt {
 public:
  virtual ~ConnectAttempt() = default;

  virtual void cancel() = 0;
};

// Establishes new transports without blocking any thread
class Connector {
 public:
  using Handler = std::function<void(std::optional<Error>, std::unique_ptr<Transport>)>;

  // The TLS context is shared with every attempt so late completions never outlive it
  Connector(asio::io_context& io_ctx, std::shared_ptr<asio::ssl::context> ssl_ctx) : io_ctx_(io_ctx), ssl_ctx_(std::move(ssl_ctx)) {}

  // The handler runs exactly once on the strand; failures are ConnectError
  std::shared_ptr<ConnectAttempt> connect(const ConnectionKey& key, const ConnectOptions& options, const Strand& strand, Handler handler);

 private:
  asio::io_context& io_ctx_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
};

// "Basic " + base64(user:password), userinfo is percent-decoded first
std::string basic_credentials(const std::string& user, const std::string& password);

std::string basic_credentials_from_userinfo(const std::string& userinfo);

}  // namespace courier::net
