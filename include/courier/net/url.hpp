#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace courier::net {

// Parsed absolute http/https URL
struct Url {
  std::string scheme;    // lowercase "http" or "https"
  std::string userinfo;  // "user:password" (percent-encoded as given), may be empty
  std::string host;      // lowercase; IPv6 literals without brackets
  uint16_t port = 0;     // 0 = scheme default
  std::string path;      // always starts with '/'
  std::string query;     // without leading '?'

  bool is_https() const {
    return scheme == "https";
  }

  uint16_t port_or_default() const;

  // host[:port], default port omitted, IPv6 bracketed
  std::string authority() const;

  // path[?query], the origin-form request target
  std::string target() const;

  std::string to_string() const;

  static std::optional<Url> parse(const std::string& url);

  // Resolve a reference (absolute, //authority, /path, ?query or relative path) against base
  static std::optional<Url> resolve(const Url& base, const std::string& reference);
};

// RFC 3986 percent-encoding; unreserved characters are kept
std::string percent_encode(const std::string& value);

std::string percent_decode(const std::string& value);

// Identifies a pool bucket
struct ConnectionKey {
  std::string scheme;
  std::string host;
  uint16_t port = 0;
  std::string proxy;     // empty for direct connections, else "scheme://host:port" of the proxy
  bool insecure = false;  // unverified TLS; never shared with verified requests

  static ConnectionKey from_url(const Url& url, const std::string& proxy = "", bool insecure = false);

  std::string to_string() const;

  bool operator==(const ConnectionKey& other) const {
    return std::tie(scheme, host, port, proxy, insecure) == std::tie(other.scheme, other.host, other.port, other.proxy, other.insecure);
  }

  bool operator!=(const ConnectionKey& other) const {
    return !(*this == other);
  }

  bool operator<(const ConnectionKey& other) const {
    return std::tie(scheme, host, port, proxy, insecure) < std::tie(other.scheme, other.host, other.port, other.proxy, other.insecure);
  }
};

}  // namespace courier::net
