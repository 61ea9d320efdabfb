#include "courier/client/client.hpp"

#include <spdlog/spdlog.h>

#include <asio/ssl.hpp>
#include <atomic>
#include <map>
#include <mutex>

#include "courier/event/event_loop.hpp"
#include "http/exchange.hpp"
#include "courier/http/redirect.hpp"
#include "courier/net/params.hpp"

namespace courier {

namespace {

// Returns an error message, or an empty string when the request can be sent
std::string validate(const Request& request) {
  if (!net::is_token(request.method)) {
    return "invalid method '" + request.method + "'";
  }
  if (!net::Url::parse(request.url)) {
    return "invalid or unsupported URL '" + request.url + "'";
  }
  if (request.proxy && !net::Url::parse(*request.proxy)) {
    return "invalid proxy URL '" + *request.proxy + "'";
  }
  if (!request.query_params.is_null() && !request.query_params.is_object()) {
    return "query params must be a map";
  }
  if (!request.form_params.is_null()) {
    if (!request.form_params.is_object()) return "form params must be a map";
    if (!std::holds_alternative<std::monostate>(request.body)) return "form params cannot be combined with a body";
  }
  if (request.basic_auth && request.oauth_token) {
    return "basic auth and oauth token are mutually exclusive";
  }
  for (const auto& [name, value] : request.headers) {
    if (!net::valid_header_name(name)) return "invalid header name '" + name + "'";
    if (!net::valid_header_value(value)) return "header '" + name + "' contains a line break or NUL";
  }
  if (request.oauth_token && !net::valid_header_value(*request.oauth_token)) {
    return "oauth token contains a line break or NUL";
  }
  if (request.basic_auth && request.basic_auth->user.find(':') != std::string::npos) {
    return "basic auth user cannot contain ':'";
  }
  if (auto parts = std::get_if<std::vector<net::Part>>(&request.body)) {
    for (const auto& part : *parts) {
      if (!net::valid_header_value(part.name) || (part.filename && !net::valid_header_value(*part.filename)) ||
          (part.content_type && !net::valid_header_value(*part.content_type))) {
        return "multipart part '" + part.name + "' has a line break or NUL in its headers";
      }
    }
  }
  return "";
}

}  // namespace

// Calls that have not been fulfilled yet
struct CallRegistry {
  class Call;

  std::mutex mutex;
  std::map<uint64_t, std::shared_ptr<Call>> calls;
  uint64_t next_id = 1;
};

/**
 * One logical request: the first exchange plus any redirect hops and the single
 * stale-connection retry. The promise is fulfilled exactly once.
 */
class CallRegistry::Call : public std::enable_shared_from_this<Call> {
 public:
  Call(asio::io_context& io_ctx, std::shared_ptr<net::ConnectionPool> pool, const ClientConfig& config, Request request,
       std::weak_ptr<CallRegistry> registry, uint64_t id)
      : io_ctx_(io_ctx),
        pool_(std::move(pool)),
        redirects_(config.redirect_policy),
        default_charset_(config.default_charset),
        max_header_bytes_(config.max_header_bytes),
        original_(request),
        current_(std::move(request)),
        registry_(std::move(registry)),
        id_(id) {}

  Future<Response> future() const {
    return promise_.get_future();
  }

  void start() {
    if (auto token = original_.cancellation) {
      std::weak_ptr<Call> weak = shared_from_this();
      auto cancel_id = token->on_cancel([weak] {
        if (auto call = weak.lock()) call->abort(make_error(ErrorKind::CancelledError, "request cancelled"));
      });
      std::lock_guard<std::mutex> lock(mutex_);
      cancel_id_ = cancel_id;
    }
    if (aborted()) return;
    launch(false);
  }

  // Fulfils the promise now; the running exchange is cancelled and its result dropped.
  // A call already streaming its body ends the stream with the error instead.
  void abort(Error error) {
    std::shared_ptr<http::Exchange> exchange;
    std::shared_ptr<http::BodyStream> stream;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      aborted_ = true;
      exchange = exchange_;
      stream = stream_;
    }
    if (exchange) exchange->cancel();
    if (stream) {
      stream->fail(std::move(error));
      unregister();
      return;
    }
    Response response = Response::failure(std::move(error));
    response.url = url_string();
    finish(std::move(response));
  }

 private:
  void launch(bool fresh_only) {
    auto url = net::Url::parse(current_.url);
    if (!url) {
      finish(Response::failure(make_error(ErrorKind::InvalidRequest, "invalid URL '" + current_.url + "'")));
      return;
    }
    net::append_query(*url, current_.query_params);

    http::ExchangeSettings settings;
    settings.url = *url;
    settings.connect.insecure = current_.insecure;
    settings.connect.fresh_only = fresh_only;
    if (current_.proxy) {
      settings.connect.proxy = net::Url::parse(*current_.proxy);
    }
    settings.timeout_ms = current_.timeout_ms.value_or(0);
    settings.connect_timeout_ms = current_.connect_timeout_ms.value_or(0);
    settings.keepalive_ms = current_.keepalive_ms.value_or(kKeepaliveDisabled);
    settings.default_charset = default_charset_;
    settings.max_header_bytes = max_header_bytes_;

    uint64_t generation;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      generation = ++generation_;
    }
    std::weak_ptr<Call> weak = shared_from_this();
    settings.on_finished = [weak, generation] {
      if (auto call = weak.lock()) call->on_exchange_finished(generation);
    };

    bool follow = current_.follow_redirects.value_or(true);
    settings.is_redirect = [follow, handler = redirects_](int status, const net::Headers& headers) {
      return follow && handler.is_redirect(status) && headers.contains("Location");
    };

    auto exchange = http::Exchange::create(io_ctx_, pool_, current_, std::move(settings));
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (aborted_) return;
      url_ = *url;
      exchange_ = exchange;
    }

    auto self = shared_from_this();
    exchange->start([self](http::ExchangeOutcome outcome) { self->on_outcome(std::move(outcome)); });
  }

  void on_outcome(http::ExchangeOutcome outcome) {
    if (aborted()) return;
    auto& response = outcome.response;

    if (outcome.stale && !retried_) {
      retried_ = true;
      spdlog::warn("{} {}: retrying once on a fresh connection ({})", current_.method, url_.to_string(), response.error->message);
      launch(true);
      return;
    }

    if (response.error) {
      finish(std::move(response));
      return;
    }

    if (response.body.kind == http::Body::Kind::Stream) {
      // Stays registered, and so cancellable, until the body ends
      {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = response.body.stream;
      }
      finish(std::move(response));
      return;
    }

    auto decision = redirects_.next(current_, url_, response.status, response.headers, static_cast<int>(history_.size()));
    switch (decision.action) {
      case http::RedirectDecision::Action::Follow: {
        {
          std::lock_guard<std::mutex> lock(mutex_);
          history_.push_back(decision.url.to_string());
        }
        current_ = std::move(decision.request);
        retried_ = false;
        launch(false);
        return;
      }

      case http::RedirectDecision::Action::LimitExceeded: {
        spdlog::warn("{} {}: {}", original_.method, original_.url, decision.reason);
        auto failure =
            Response::failure(make_error(ErrorKind::RedirectLimitError, decision.reason + " (next: " + decision.url.to_string() + ")"));
        failure.status = response.status;
        failure.headers = std::move(response.headers);
        failure.url = std::move(response.url);
        finish(std::move(failure));
        return;
      }

      case http::RedirectDecision::Action::Stop:
        finish(std::move(response));
        return;
    }
  }

  void finish(Response response) {
    response.opts = original_;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      response.redirects = history_;
    }
    if (response.url.empty()) response.url = original_.url;

    bool streaming;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      streaming = stream_ != nullptr;
    }
    if (promise_.set_value(std::move(response)) && !streaming) {
      unregister();
    }
  }

  void on_exchange_finished(uint64_t generation) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!stream_ || generation != generation_) return;
    }
    unregister();
  }

  void unregister() {
    uint64_t cancel_id;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancel_id = cancel_id_;
      cancel_id_ = 0;
    }
    if (cancel_id) original_.cancellation->remove(cancel_id);
    if (auto registry = registry_.lock()) {
      std::lock_guard<std::mutex> lock(registry->mutex);
      registry->calls.erase(id_);
    }
  }

  bool aborted() {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_;
  }

  std::string url_string() {
    std::lock_guard<std::mutex> lock(mutex_);
    return url_.host.empty() ? original_.url : url_.to_string();
  }

  asio::io_context& io_ctx_;
  std::shared_ptr<net::ConnectionPool> pool_;
  http::RedirectHandler redirects_;
  std::string default_charset_;
  size_t max_header_bytes_;

  const Request original_;
  Request current_;
  bool retried_ = false;

  std::mutex mutex_;
  std::vector<std::string> history_;
  net::Url url_;
  std::shared_ptr<http::Exchange> exchange_;
  uint64_t generation_ = 0;
  std::shared_ptr<http::BodyStream> stream_;  // set once a streamed response is handed out
  uint64_t cancel_id_ = 0;
  bool aborted_ = false;

  Promise<Response> promise_;
  std::weak_ptr<CallRegistry> registry_;
  uint64_t id_;
};

class Client::Impl {
 public:
  explicit Impl(ClientConfig config)
      : config_(std::move(config)),
        loop_(std::make_unique<EventLoop>(config_.io_threads)),
        io_ctx_(loop_->context()),
        ssl_ctx_(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client)) {
    init();
    loop_->start();
  }

  Impl(asio::io_context& io_ctx, ClientConfig config)
      : config_(std::move(config)), io_ctx_(io_ctx), ssl_ctx_(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client)) {
    init();
  }

  ~Impl() {
    shutdown();
  }

  Future<Response> request(Request request) {
    if (shutdown_) {
      auto response = Response::failure(make_error(ErrorKind::Shutdown, "client is shut down"));
      response.url = request.url;
      response.opts = std::move(request);
      return make_ready_future(std::move(response));
    }

    config_.apply_defaults(request);
    auto problem = validate(request);
    if (!problem.empty()) {
      spdlog::warn("rejecting {} {}: {}", request.method, request.url, problem);
      auto response = Response::failure(make_error(ErrorKind::InvalidRequest, problem));
      response.url = request.url;
      response.opts = std::move(request);
      return make_ready_future(std::move(response));
    }

    spdlog::debug("{} {}", request.method, request.url);

    std::shared_ptr<CallRegistry::Call> call;
    {
      std::lock_guard<std::mutex> lock(registry_->mutex);
      auto id = registry_->next_id++;
      call = std::make_shared<CallRegistry::Call>(io_ctx_, pool_, config_, std::move(request), registry_, id);
      registry_->calls.emplace(id, call);
    }

    auto future = call->future();
    call->start();
    return future;
  }

  size_t in_flight() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->calls.size();
  }

  void abort_all(const Error& error) {
    std::vector<std::shared_ptr<CallRegistry::Call>> calls;
    {
      std::lock_guard<std::mutex> lock(registry_->mutex);
      for (auto& [id, call] : registry_->calls) {
        calls.push_back(call);
      }
    }
    for (auto& call : calls) {
      call->abort(error);
    }
  }

  void shutdown() {
    if (shutdown_.exchange(true)) return;

    abort_all(make_error(ErrorKind::Shutdown, "client is shut down"));
    pool_->shutdown();
    if (loop_) {
      loop_->stop();
    }
    spdlog::info("client shut down");
  }

  ClientConfig config_;
  std::unique_ptr<EventLoop> loop_;
  asio::io_context& io_ctx_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
  std::shared_ptr<net::ConnectionPool> pool_;
  std::shared_ptr<CallRegistry> registry_ = std::make_shared<CallRegistry>();
  std::atomic<bool> shutdown_{false};

 private:
  void init() {
    ssl_ctx_->set_default_verify_paths();
    ssl_ctx_->set_verify_mode(asio::ssl::verify_peer);

    net::PoolOptions options;
    options.max_connections_per_host = config_.max_connections_per_host;
    options.sweep_interval = Millis(config_.pool_sweep_interval_ms);
    pool_ = net::ConnectionPool::create(io_ctx_, ssl_ctx_, options);
  }
};

Client::Client(ClientConfig config) : impl_(std::make_unique<Impl>(std::move(config))) {}

Client::Client(asio::io_context& io_ctx, ClientConfig config) : impl_(std::make_unique<Impl>(io_ctx, std::move(config))) {}

Client::~Client() = default;

Future<Response> Client::request(Request request) {
  return impl_->request(std::move(request));
}

void Client::request(Request request, Callback callback) {
  impl_->request(std::move(request)).then(std::move(callback));
}

namespace {

Request with_method(const std::string& method, const std::string& url, Request options) {
  options.method = method;
  options.url = url;
  return options;
}

}  // namespace

Future<Response> Client::get(const std::string& url, Request options) {
  return request(with_method("GET", url, std::move(options)));
}

Future<Response> Client::post(const std::string& url, Request options) {
  return request(with_method("POST", url, std::move(options)));
}

Future<Response> Client::put(const std::string& url, Request options) {
  return request(with_method("PUT", url, std::move(options)));
}

Future<Response> Client::patch(const std::string& url, Request options) {
  return request(with_method("PATCH", url, std::move(options)));
}

Future<Response> Client::del(const std::string& url, Request options) {
  return request(with_method("DELETE", url, std::move(options)));
}

Future<Response> Client::head(const std::string& url, Request options) {
  return request(with_method("HEAD", url, std::move(options)));
}

Future<Response> Client::options(const std::string& url, Request options) {
  return request(with_method("OPTIONS", url, std::move(options)));
}

net::ConnectionPool& Client::pool() {
  return *impl_->pool_;
}

const ClientConfig& Client::config() const {
  return impl_->config_;
}

asio::io_context& Client::context() {
  return impl_->io_ctx_;
}

size_t Client::in_flight() const {
  return impl_->in_flight();
}

void Client::cancel_all() {
  impl_->abort_all(make_error(ErrorKind::CancelledError, "request cancelled"));
}

void Client::shutdown() {
  impl_->shutdown();
}

bool Client::is_shutdown() const {
  return impl_->shutdown_.load();
}

}  // namespace courier
