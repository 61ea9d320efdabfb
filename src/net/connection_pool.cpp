#include "courier/net/connection_pool.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace courier::net {

void AcquireTicket::cancel() {
  cancelled_ = true;
  std::shared_ptr<ConnectAttempt> attempt;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    attempt = attempt_;
  }
  if (attempt) {
    attempt->cancel();
  }
}

std::shared_ptr<ConnectionPool> ConnectionPool::create(asio::io_context& io_ctx, std::shared_ptr<asio::ssl::context> ssl_ctx,
                                                       PoolOptions options) {
  std::shared_ptr<ConnectionPool> pool(new ConnectionPool(io_ctx, std::move(ssl_ctx), options));
  pool->schedule_sweep();
  return pool;
}

ConnectionPool::ConnectionPool(asio::io_context& io_ctx, std::shared_ptr<asio::ssl::context> ssl_ctx, PoolOptions options)
    : connector_(io_ctx, std::move(ssl_ctx)), options_(options), sweep_strand_(asio::make_strand(io_ctx)), sweep_timer_(io_ctx) {}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(buckets_mutex_);
  for (auto& [key, bucket] : buckets_) {
    std::lock_guard<std::mutex> bucket_lock(bucket->mutex);
    for (auto& conn : bucket->idle) {
      conn->close();
    }
    bucket->idle.clear();
  }
}

ConnectionKey ConnectionPool::key_for(const Url& url, const ConnectOptions& options) {
  std::string proxy;
  if (options.proxy) {
    proxy = options.proxy->scheme + "://" + options.proxy->authority();
  }
  return ConnectionKey::from_url(url, proxy, options.insecure);
}

std::shared_ptr<ConnectionPool::Bucket> ConnectionPool::bucket_for(const ConnectionKey& key, bool create) const {
  std::lock_guard<std::mutex> lock(buckets_mutex_);
  auto it = buckets_.find(key);
  if (it != buckets_.end()) {
    return it->second;
  }
  if (!create) {
    return nullptr;
  }
  auto bucket = std::make_shared<Bucket>();
  buckets_.emplace(key, bucket);
  return bucket;
}

void ConnectionPool::set_interceptor(Interceptor interceptor) {
  std::lock_guard<std::mutex> lock(interceptor_mutex_);
  interceptor_ = std::move(interceptor);
}

std::shared_ptr<AcquireTicket> ConnectionPool::acquire(const Url& url, const ConnectOptions& options, const Strand& strand,
                                                       AcquireHandler handler) {
  auto ticket = std::make_shared<AcquireTicket>();

  if (shutdown_) {
    asio::post(strand, [handler = std::move(handler)] { handler(make_error(ErrorKind::Shutdown, "connection pool is shut down"), nullptr, false); });
    return ticket;
  }

  auto key = key_for(url, options);

  std::vector<std::shared_ptr<Connection>> stale;
  std::shared_ptr<Connection> reused;
  bool create = false;
  std::shared_ptr<Bucket> bucket;
  for (;;) {
    bucket = bucket_for(key, true);
    std::lock_guard<std::mutex> lock(bucket->mutex);
    // Lost a race with evict_idle; look the key up again
    if (bucket->removed) continue;

    auto now = Clock::now();
    if (!options.fresh_only) {
      // Most recently used first
      while (!bucket->idle.empty()) {
        auto conn = bucket->idle.back();
        bucket->idle.pop_back();
        if (conn->expired(now) || !conn->is_open()) {
          stale.push_back(conn);
          continue;
        }
        reused = conn;
        break;
      }
    }

    if (reused) {
      reused->mark_in_use();
      ++bucket->active;
    } else if (options_.max_connections_per_host == 0 || bucket->active < options_.max_connections_per_host) {
      ++bucket->active;
      create = true;
    } else {
      bucket->waiters.push_back(Waiter{ticket, url, options, strand, std::move(handler)});
    }
    break;
  }

  for (auto& conn : stale) {
    spdlog::debug("evicting idle connection #{} to {}", conn->id(), key.to_string());
    conn->close();
  }

  if (reused) {
    spdlog::debug("reusing connection #{} to {}", reused->id(), key.to_string());
    asio::post(strand, [handler = std::move(handler), reused] { handler(std::nullopt, reused, true); });
  } else if (create) {
    Interceptor interceptor;
    {
      std::lock_guard<std::mutex> lock(interceptor_mutex_);
      interceptor = interceptor_;
    }
    std::unique_ptr<Transport> transport = interceptor ? interceptor(url) : nullptr;
    if (transport) {
      auto conn = std::make_shared<Connection>(key, std::move(transport));
      spdlog::debug("connection #{} to {} intercepted", conn->id(), key.to_string());
      asio::post(strand, [handler = std::move(handler), conn] { handler(std::nullopt, conn, false); });
    } else {
      establish(key, bucket, Waiter{ticket, url, options, strand, std::move(handler)});
    }
  } else {
    spdlog::debug("pool for {} exhausted, request queued", key.to_string());
  }

  return ticket;
}

void ConnectionPool::establish(const ConnectionKey& key, const std::shared_ptr<Bucket>& bucket, Waiter waiter) {
  std::weak_ptr<ConnectionPool> weak = shared_from_this();
  auto ticket = waiter.ticket;

  auto attempt = connector_.connect(key, waiter.options, waiter.strand,
                                    [weak, key, bucket, waiter](std::optional<Error> error, std::unique_ptr<Transport> transport) {
                                      auto self = weak.lock();
                                      if (error || !self) {
                                        {
                                          std::lock_guard<std::mutex> lock(bucket->mutex);
                                          if (bucket->active > 0) --bucket->active;
                                        }
                                        if (self) self->serve_next_waiter(key, bucket);
                                        waiter.handler(error ? error : make_error(ErrorKind::Shutdown, "connection pool destroyed"), nullptr, false);
                                        return;
                                      }

                                      auto conn = std::make_shared<Connection>(key, std::move(transport));
                                      spdlog::debug("connection #{} opened to {}", conn->id(), key.to_string());

                                      if (waiter.ticket->cancelled()) {
                                        self->discard(conn);
                                        return;
                                      }
                                      waiter.handler(std::nullopt, conn, false);
                                    });

  std::lock_guard<std::mutex> lock(ticket->mutex_);
  ticket->attempt_ = attempt;
  if (ticket->cancelled()) {
    attempt->cancel();
  }
}

void ConnectionPool::serve_next_waiter(const ConnectionKey& key, const std::shared_ptr<Bucket>& bucket) {
  std::optional<Waiter> next;
  {
    std::lock_guard<std::mutex> lock(bucket->mutex);
    while (!bucket->waiters.empty() && bucket->waiters.front().ticket->cancelled()) {
      bucket->waiters.pop_front();
    }
    if (bucket->waiters.empty()) {
      return;
    }
    if (options_.max_connections_per_host != 0 && bucket->active >= options_.max_connections_per_host) {
      return;
    }
    next = std::move(bucket->waiters.front());
    bucket->waiters.pop_front();
    ++bucket->active;
  }

  if (shutdown_) {
    {
      std::lock_guard<std::mutex> lock(bucket->mutex);
      --bucket->active;
    }
    asio::post(next->strand, [handler = std::move(next->handler)] {
      handler(make_error(ErrorKind::Shutdown, "connection pool is shut down"), nullptr, false);
    });
    return;
  }
  establish(key, bucket, std::move(*next));
}

void ConnectionPool::release(const std::shared_ptr<Connection>& conn, int64_t keepalive_ms) {
  if (!conn) return;

  const auto& key = conn->key();
  auto bucket = bucket_for(key, false);
  bool keep = keepalive_ms > 0 && conn->is_open() && !shutdown_;

  std::optional<Waiter> handoff;
  if (bucket) {
    std::lock_guard<std::mutex> lock(bucket->mutex);
    if (bucket->active > 0) --bucket->active;

    if (keep) {
      while (!bucket->waiters.empty()) {
        auto waiter = std::move(bucket->waiters.front());
        bucket->waiters.pop_front();
        if (!waiter.ticket->cancelled()) {
          handoff = std::move(waiter);
          break;
        }
      }
      if (handoff) {
        conn->mark_in_use();
        ++bucket->active;
      } else {
        conn->mark_idle(Clock::now() + Millis(keepalive_ms));
        bucket->idle.push_back(conn);
      }
    }
  }

  if (!keep || !bucket) {
    conn->close();
    if (bucket) serve_next_waiter(key, bucket);
    return;
  }

  if (handoff) {
    spdlog::debug("handing connection #{} to {} to a queued request", conn->id(), key.to_string());
    asio::post(handoff->strand, [handler = std::move(handoff->handler), conn] { handler(std::nullopt, conn, true); });
  } else {
    spdlog::debug("connection #{} to {} idle for {} ms", conn->id(), key.to_string(), keepalive_ms);
  }
}

size_t ConnectionPool::evict_idle(TimePoint now) {
  std::vector<std::shared_ptr<Bucket>> buckets;
  {
    std::lock_guard<std::mutex> lock(buckets_mutex_);
    for (auto& [key, bucket] : buckets_) {
      buckets.push_back(bucket);
    }
  }

  std::vector<std::shared_ptr<Connection>> evicted;
  for (auto& bucket : buckets) {
    std::lock_guard<std::mutex> lock(bucket->mutex);
    for (auto it = bucket->idle.begin(); it != bucket->idle.end();) {
      if ((*it)->expired(now) || !(*it)->is_open()) {
        evicted.push_back(*it);
        it = bucket->idle.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& conn : evicted) {
    spdlog::debug("evicting idle connection #{} to {}", conn->id(), conn->key().to_string());
    conn->close();
  }

  {
    std::lock_guard<std::mutex> lock(buckets_mutex_);
    for (auto it = buckets_.begin(); it != buckets_.end();) {
      std::lock_guard<std::mutex> bucket_lock(it->second->mutex);
      if (it->second->unused()) {
        it->second->removed = true;
        it = buckets_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return evicted.size();
}

size_t ConnectionPool::idle_count(const ConnectionKey& key) const {
  auto bucket = bucket_for(key, false);
  if (!bucket) return 0;
  std::lock_guard<std::mutex> lock(bucket->mutex);
  return bucket->idle.size();
}

size_t ConnectionPool::total_idle() const {
  std::lock_guard<std::mutex> lock(buckets_mutex_);
  size_t total = 0;
  for (const auto& [key, bucket] : buckets_) {
    std::lock_guard<std::mutex> bucket_lock(bucket->mutex);
    total += bucket->idle.size();
  }
  return total;
}

size_t ConnectionPool::bucket_count() const {
  std::lock_guard<std::mutex> lock(buckets_mutex_);
  return buckets_.size();
}

size_t ConnectionPool::active_count(const ConnectionKey& key) const {
  auto bucket = bucket_for(key, false);
  if (!bucket) return 0;
  std::lock_guard<std::mutex> lock(bucket->mutex);
  return bucket->active;
}

void ConnectionPool::schedule_sweep() {
  if (options_.sweep_interval.count() <= 0) return;

  std::weak_ptr<ConnectionPool> weak = shared_from_this();
  asio::dispatch(sweep_strand_, [weak] {
    auto self = weak.lock();
    if (!self || self->shutdown_) return;
    self->sweep_timer_.expires_after(self->options_.sweep_interval);
    self->sweep_timer_.async_wait(asio::bind_executor(self->sweep_strand_, [weak](const asio::error_code& ec) {
      if (ec) return;
      auto self = weak.lock();
      if (!self || self->shutdown_) return;
      self->evict_idle();
      self->schedule_sweep();
    }));
  });
}

void ConnectionPool::shutdown() {
  if (shutdown_.exchange(true)) return;

  std::weak_ptr<ConnectionPool> weak = shared_from_this();
  asio::post(sweep_strand_, [weak] {
    if (auto self = weak.lock()) self->sweep_timer_.cancel();
  });

  std::vector<std::shared_ptr<Bucket>> buckets;
  {
    std::lock_guard<std::mutex> lock(buckets_mutex_);
    for (auto& [key, bucket] : buckets_) {
      buckets.push_back(bucket);
    }
  }

  std::vector<std::shared_ptr<Connection>> idle;
  std::vector<Waiter> waiters;
  for (auto& bucket : buckets) {
    std::lock_guard<std::mutex> lock(bucket->mutex);
    idle.insert(idle.end(), bucket->idle.begin(), bucket->idle.end());
    bucket->idle.clear();
    for (auto& waiter : bucket->waiters) {
      waiters.push_back(std::move(waiter));
    }
    bucket->waiters.clear();
  }

  for (auto& conn : idle) {
    conn->close();
  }
  for (auto& waiter : waiters) {
    if (waiter.ticket->cancelled()) continue;
    asio::post(waiter.strand, [handler = std::move(waiter.handler)] {
      handler(make_error(ErrorKind::Shutdown, "connection pool is shut down"), nullptr, false);
    });
  }

  spdlog::info("connection pool shut down ({} idle connection(s) closed, {} waiter(s) failed)", idle.size(), waiters.size());
}

}  // namespace courier::net
