#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <string>

#include "courier/core/config.hpp"
#include "courier/core/future.hpp"
#include "courier/http/request.hpp"
#include "courier/http/response.hpp"
#include "courier/net/connection_pool.hpp"

namespace courier {

using http::Request;
using http::Response;

/**
 * Asynchronous HTTP client.
 *
 * Owns the connection pool and, unless an io_context is supplied, an EventLoop that runs it.
 * Every call returns immediately; the Future is fulfilled exactly once with either a response
 * or an error (never an exception), so blocking get() and then() observe the same result.
 */
class Client {
 public:
  using Callback = std::function<void(const Response&)>;

  // Runs its own EventLoop with config.io_threads threads
  explicit Client(ClientConfig config = {});

  // Borrows the caller's io_context; the caller keeps it running
  Client(asio::io_context& io_ctx, ClientConfig config = {});

  // Calls shutdown()
  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  Future<Response> request(Request request);

  // Callback runs on an io thread, or immediately if the request fails validation
  void request(Request request, Callback callback);

  Future<Response> get(const std::string& url, Request options = {});

  Future<Response> post(const std::string& url, Request options = {});

  Future<Response> put(const std::string& url, Request options = {});

  Future<Response> patch(const std::string& url, Request options = {});

  Future<Response> del(const std::string& url, Request options = {});

  Future<Response> head(const std::string& url, Request options = {});

  Future<Response> options(const std::string& url, Request options = {});

  net::ConnectionPool& pool();

  const ClientConfig& config() const;

  asio::io_context& context();

  // Calls not yet fulfilled, plus streamed calls whose body has not ended
  size_t in_flight() const;

  // Fails every in-flight call with CancelledError; streamed bodies end with the same error
  void cancel_all();

  // Fails in-flight calls with Shutdown, closes pooled connections and stops an owned loop.
  // Later requests fail with Shutdown. Idempotent.
  void shutdown();

  bool is_shutdown() const;

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

}  // namespace courier
