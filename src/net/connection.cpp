#include "courier/net/connection.hpp"

#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <istream>
#include <sstream>
#include <vector>

namespace courier::net {

std::atomic<uint64_t> Connection::next_id_{1};

Connection::Connection(ConnectionKey key, std::unique_ptr<Transport> transport)
    : id_(next_id_++), key_(std::move(key)), transport_(std::move(transport)) {}

Connection::~Connection() {
  close();
}

bool Connection::is_open() const {
  auto state = state_.load();
  return state != ConnectionState::Closed && state != ConnectionState::Closing && transport_->is_open();
}

void Connection::mark_in_use() {
  state_ = ConnectionState::InUse;
  touch();
}

void Connection::mark_idle(TimePoint expires_at) {
  state_ = ConnectionState::Idle;
  expires_at_ = expires_at;
  touch();
}

void Connection::close() {
  auto previous = state_.exchange(ConnectionState::Closing);
  if (previous == ConnectionState::Closed) {
    state_ = ConnectionState::Closed;
    return;
  }
  transport_->close();
  state_ = ConnectionState::Closed;
  spdlog::debug("connection #{} to {} closed after {} request(s)", id_, key_.to_string(), requests_served_);
}

std::string basic_credentials(const std::string& user, const std::string& password) {
  std::string plain = user + ":" + password;
  std::vector<unsigned char> out(4 * ((plain.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(plain.data()), static_cast<int>(plain.size()));
  return "Basic " + std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
}

std::string basic_credentials_from_userinfo(const std::string& userinfo) {
  auto colon = userinfo.find(':');
  if (colon == std::string::npos) {
    return basic_credentials(percent_decode(userinfo), "");
  }
  return basic_credentials(percent_decode(userinfo.substr(0, colon)), percent_decode(userinfo.substr(colon + 1)));
}

namespace {

class ConnectOperation : public ConnectAttempt, public std::enable_shared_from_this<ConnectOperation> {
 public:
  ConnectOperation(asio::io_context& io_ctx, std::shared_ptr<asio::ssl::context> ssl_ctx, ConnectionKey key, ConnectOptions options, Strand strand,
                   Connector::Handler handler)
      : io_ctx_(io_ctx),
        ssl_ctx_(std::move(ssl_ctx)),
        key_(std::move(key)),
        options_(std::move(options)),
        strand_(std::move(strand)),
        resolver_(io_ctx),
        handler_(std::move(handler)) {}

  void start() {
    std::string host = options_.proxy ? options_.proxy->host : key_.host;
    std::string port = std::to_string(options_.proxy ? options_.proxy->port_or_default() : key_.port);

    auto self = shared_from_this();
    resolver_.async_resolve(host, port,
                            asio::bind_executor(strand_, [self](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
                              self->on_resolved(ec, std::move(results));
                            }));
  }

  void cancel() override {
    auto self = shared_from_this();
    asio::dispatch(strand_, [self] {
      self->cancelled_ = true;
      self->resolver_.cancel();
      self->close_socket();
    });
  }

 private:
  asio::ip::tcp::socket& lowest() {
    return tls_ ? tls_->next_layer() : *socket_;
  }

  void close_socket() {
    asio::error_code ignored;
    if (tls_) tls_->lowest_layer().close(ignored);
    if (socket_) socket_->close(ignored);
  }

  void on_resolved(const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
    if (cancelled_) {
      fail("connect cancelled");
      return;
    }
    if (ec) {
      fail("DNS resolution failed: " + ec.message());
      return;
    }

    if (key_.scheme == "https") {
      tls_ = std::make_unique<TlsTransport::Stream>(io_ctx_, *ssl_ctx_);
    } else {
      socket_ = std::make_unique<asio::ip::tcp::socket>(io_ctx_);
    }

    auto self = shared_from_this();
    asio::async_connect(lowest(), results, asio::bind_executor(strand_, [self](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                          self->on_connected(ec);
                        }));
  }

  void on_connected(const asio::error_code& ec) {
    if (cancelled_) {
      fail("connect cancelled");
      return;
    }
    if (ec) {
      fail("Connection failed: " + ec.message());
      return;
    }

    asio::error_code ignored;
    lowest().set_option(asio::ip::tcp::no_delay(true), ignored);

    if (options_.proxy && tls_) {
      open_tunnel();
    } else if (tls_) {
      handshake();
    } else {
      succeed();
    }
  }

  // HTTPS through a proxy: CONNECT host:port, then TLS inside the tunnel
  void open_tunnel() {
    std::string authority = (key_.host.find(':') != std::string::npos ? "[" + key_.host + "]" : key_.host) + ":" + std::to_string(key_.port);
    std::ostringstream req;
    req << "CONNECT " << authority << " HTTP/1.1\r\n";
    req << "Host: " << authority << "\r\n";
    if (!options_.proxy->userinfo.empty()) {
      req << "Proxy-Authorization: " << basic_credentials_from_userinfo(options_.proxy->userinfo) << "\r\n";
    }
    req << "\r\n";
    tunnel_request_ = req.str();

    auto self = shared_from_this();
    asio::async_write(lowest(), asio::buffer(tunnel_request_), asio::bind_executor(strand_, [self](const asio::error_code& ec, size_t) {
                        if (self->cancelled_ || ec) {
                          self->fail("Proxy CONNECT write failed: " + (ec ? ec.message() : std::string("cancelled")));
                          return;
                        }
                        self->read_tunnel_response();
                      }));
  }

  void read_tunnel_response() {
    auto self = shared_from_this();
    asio::async_read_until(lowest(), tunnel_buffer_, "\r\n\r\n", asio::bind_executor(strand_, [self](const asio::error_code& ec, size_t) {
                             if (self->cancelled_ || ec) {
                               self->fail("Proxy CONNECT read failed: " + (ec ? ec.message() : std::string("cancelled")));
                               return;
                             }

                             std::istream stream(&self->tunnel_buffer_);
                             std::string status_line;
                             std::getline(stream, status_line);

                             int status = 0;
                             auto space = status_line.find(' ');
                             if (status_line.rfind("HTTP/", 0) == 0 && space != std::string::npos) {
                               status = std::atoi(status_line.c_str() + space + 1);
                             }
                             if (status < 200 || status >= 300) {
                               self->fail("Proxy CONNECT refused with status " + std::to_string(status));
                               return;
                             }
                             self->handshake();
                           }));
  }

  void handshake() {
    // Set SNI hostname
    SSL_set_tlsext_host_name(tls_->native_handle(), key_.host.c_str());

    if (options_.insecure) {
      tls_->set_verify_mode(asio::ssl::verify_none);
    } else {
      tls_->set_verify_mode(asio::ssl::verify_peer);
      tls_->set_verify_callback(asio::ssl::host_name_verification(key_.host));
    }

    auto self = shared_from_this();
    tls_->async_handshake(asio::ssl::stream_base::client, asio::bind_executor(strand_, [self](const asio::error_code& ec) {
                            if (self->cancelled_) {
                              self->fail("connect cancelled");
                              return;
                            }
                            if (ec) {
                              self->fail("SSL handshake failed: " + ec.message());
                              return;
                            }
                            self->succeed();
                          }));
  }

  void succeed() {
    if (done_) return;
    done_ = true;

    std::unique_ptr<Transport> transport;
    if (tls_) {
      transport = std::make_unique<TlsTransport>(std::move(tls_));
    } else {
      transport = std::make_unique<TcpTransport>(std::move(*socket_));
      socket_.reset();
    }
    auto handler = std::move(handler_);
    handler(std::nullopt, std::move(transport));
  }

  void fail(const std::string& message) {
    if (done_) return;
    done_ = true;
    close_socket();
    spdlog::debug("connect to {} failed: {}", key_.to_string(), message);
    auto handler = std::move(handler_);
    handler(make_error(ErrorKind::ConnectError, message), nullptr);
  }

  asio::io_context& io_ctx_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
  ConnectionKey key_;
  ConnectOptions options_;
  Strand strand_;
  asio::ip::tcp::resolver resolver_;
  std::unique_ptr<asio::ip::tcp::socket> socket_;
  std::unique_ptr<TlsTransport::Stream> tls_;
  std::string tunnel_request_;
  asio::streambuf tunnel_buffer_;
  Connector::Handler handler_;
  bool cancelled_ = false;
  bool done_ = false;
};

}  // namespace

std::shared_ptr<ConnectAttempt> Connector::connect(const ConnectionKey& key, const ConnectOptions& options, const Strand& strand,
                                                   Handler handler) {
  auto op = std::make_shared<ConnectOperation>(io_ctx_, ssl_ctx_, key, options, strand, std::move(handler));
  asio::dispatch(strand, [op] { op->start(); });
  return op;
}

}  // namespace courier::net
