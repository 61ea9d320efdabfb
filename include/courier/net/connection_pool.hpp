#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "courier/core/types.hpp"
#include "courier/net/connection.hpp"
#include "courier/net/url.hpp"

namespace courier::net {

// Pending acquisition; cancel() aborts a queued wait or an in-flight connect
class AcquireTicket {
 public:
  void cancel();

  bool cancelled() const {
    return cancelled_.load();
  }

 private:
  friend class ConnectionPool;

  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::shared_ptr<ConnectAttempt> attempt_;
};

struct PoolOptions {
  size_t max_connections_per_host = 0;  // 0 = unbounded
  Millis sweep_interval{1000};
};

/**
 * Keyed cache of idle connections.
 *
 * Buckets are keyed by (scheme, host, port, proxy). Each bucket has its own mutex; the
 * bucket map lock is only held to look up or create a bucket, so unrelated hosts never
 * contend. Idle connections carry an expiry (now + keepalive) and are evicted lazily on
 * acquire and by a periodic sweep.
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
 public:
  // reused == true when an idle connection was handed out
  using AcquireHandler = std::function<void(std::optional<Error>, std::shared_ptr<Connection>, bool reused)>;

  // May substitute a transport (e.g. a CannedTransport) for a URL; nullptr means real I/O
  using Interceptor = std::function<std::unique_ptr<Transport>(const Url&)>;

  static std::shared_ptr<ConnectionPool> create(asio::io_context& io_ctx, std::shared_ptr<asio::ssl::context> ssl_ctx,
                                                PoolOptions options = {});

  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  // Handler runs exactly once on the strand unless the ticket is cancelled first
  std::shared_ptr<AcquireTicket> acquire(const Url& url, const ConnectOptions& options, const Strand& strand, AcquireHandler handler);

  // keepalive_ms <= 0 closes the connection; otherwise it becomes idle until now + keepalive_ms
  void release(const std::shared_ptr<Connection>& conn, int64_t keepalive_ms);

  // Close without pooling (failed, cancelled or non-reusable exchange)
  void discard(const std::shared_ptr<Connection>& conn) {
    release(conn, kKeepaliveDisabled);
  }

  // Closes idle connections expired at `now` and drops buckets left unused; returns how many were evicted
  size_t evict_idle(TimePoint now = Clock::now());

  size_t idle_count(const ConnectionKey& key) const;

  size_t total_idle() const;

  size_t bucket_count() const;

  // Connections handed out or being established for the key
  size_t active_count(const ConnectionKey& key) const;

  void set_interceptor(Interceptor interceptor);

  // Closes idle connections, fails waiters and rejects further acquires
  void shutdown();

  bool is_shutdown() const {
    return shutdown_.load();
  }

  const PoolOptions& options() const {
    return options_;
  }

 private:
  struct Waiter {
    std::shared_ptr<AcquireTicket> ticket;
    Url url;
    ConnectOptions options;
    Strand strand;
    AcquireHandler handler;
  };

  struct Bucket {
    mutable std::mutex mutex;
    std::deque<std::shared_ptr<Connection>> idle;
    size_t active = 0;
    std::deque<Waiter> waiters;
    bool removed = false;  // dropped from buckets_ by evict_idle

    bool unused() const {
      return idle.empty() && active == 0 && waiters.empty();
    }
  };

  ConnectionPool(asio::io_context& io_ctx, std::shared_ptr<asio::ssl::context> ssl_ctx, PoolOptions options);

  std::shared_ptr<Bucket> bucket_for(const ConnectionKey& key, bool create) const;

  void establish(const ConnectionKey& key, const std::shared_ptr<Bucket>& bucket, Waiter waiter);

  void serve_next_waiter(const ConnectionKey& key, const std::shared_ptr<Bucket>& bucket);

  void schedule_sweep();

  static ConnectionKey key_for(const Url& url, const ConnectOptions& options);

  Connector connector_;
  PoolOptions options_;
  Strand sweep_strand_;
  asio::steady_timer sweep_timer_;

  mutable std::mutex buckets_mutex_;
  mutable std::map<ConnectionKey, std::shared_ptr<Bucket>> buckets_;

  std::mutex interceptor_mutex_;
  Interceptor interceptor_;

  std::atomic<bool> shutdown_{false};
};

}  // namespace courier::net
