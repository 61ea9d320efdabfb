#include "courier/net/url.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "courier/net/headers.hpp"

namespace courier::net {

namespace {

bool is_unreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool is_reference_char(unsigned char c) {
  if (is_unreserved(c)) return true;
  switch (c) {
    case ':': case '/': case '?': case '#': case '[': case ']': case '@':
    case '!': case '$': case '&': case '\'': case '(': case ')': case '*': case '+': case ',': case ';': case '=':
      return true;
    default:
      return false;
  }
}

// Location values in the wild carry raw spaces and UTF-8; encode whatever a URI cannot hold.
// A '%' already starting an escape is kept.
std::string encode_reference(const std::string& ref) {
  static const char* hex = "0123456789ABCDEF";
  std::string result;
  result.reserve(ref.size());
  for (size_t i = 0; i < ref.size(); ++i) {
    unsigned char c = ref[i];
    bool escape = c == '%' && i + 2 < ref.size() && hex_value(ref[i + 1]) >= 0 && hex_value(ref[i + 2]) >= 0;
    if (escape || is_reference_char(c)) {
      result += static_cast<char>(c);
    } else {
      result += '%';
      result += hex[c >> 4];
      result += hex[c & 0x0F];
    }
  }
  return result;
}

// Remove "." and ".." segments (RFC 3986 5.2.4); path starts with '/'
std::string remove_dot_segments(const std::string& path) {
  std::vector<std::string> parts;
  size_t pos = 1;
  while (pos <= path.size()) {
    size_t next = path.find('/', pos);
    if (next == std::string::npos) next = path.size();
    parts.push_back(path.substr(pos, next - pos));
    pos = next + 1;
  }

  std::vector<std::string> segments;
  bool trailing_slash = false;
  for (size_t i = 0; i < parts.size(); ++i) {
    const auto& segment = parts[i];
    bool last = i + 1 == parts.size();
    if (segment == "..") {
      if (!segments.empty()) segments.pop_back();
      trailing_slash = last;
    } else if (segment == "." || segment.empty()) {
      trailing_slash = last;
    } else {
      segments.push_back(segment);
      trailing_slash = false;
    }
  }

  std::string result;
  for (const auto& segment : segments) {
    result += "/" + segment;
  }
  if (trailing_slash || result.empty()) {
    result += "/";
  }
  return result;
}

}  // namespace

uint16_t Url::port_or_default() const {
  if (port != 0) return port;
  return is_https() ? 443 : 80;
}

std::string Url::authority() const {
  std::string result = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  bool default_port = port == 0 || port == (is_https() ? 443 : 80);
  if (!default_port) {
    result += ":" + std::to_string(port);
  }
  return result;
}

std::string Url::target() const {
  if (query.empty()) return path;
  return path + "?" + query;
}

std::string Url::to_string() const {
  std::string result = scheme + "://";
  if (!userinfo.empty()) {
    result += userinfo + "@";
  }
  return result + authority() + target();
}

std::optional<Url> Url::parse(const std::string& url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos) {
    return std::nullopt;
  }

  Url result;
  result.scheme = to_lower(url.substr(0, scheme_end));
  if (result.scheme != "http" && result.scheme != "https") {
    return std::nullopt;
  }

  std::string rest = url.substr(scheme_end + 3);

  // Drop the fragment
  auto hash = rest.find('#');
  if (hash != std::string::npos) {
    rest.erase(hash);
  }

  auto authority_end = rest.find_first_of("/?");
  std::string authority = rest.substr(0, authority_end);
  std::string path_and_query = authority_end == std::string::npos ? "" : rest.substr(authority_end);

  auto at = authority.rfind('@');
  if (at != std::string::npos) {
    result.userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
  }

  std::string port_str;
  if (!authority.empty() && authority[0] == '[') {
    auto close = authority.find(']');
    if (close == std::string::npos) {
      return std::nullopt;
    }
    result.host = authority.substr(1, close - 1);
    std::string after = authority.substr(close + 1);
    if (!after.empty()) {
      if (after[0] != ':') return std::nullopt;
      port_str = after.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      result.host = authority.substr(0, colon);
      port_str = authority.substr(colon + 1);
    } else {
      result.host = authority;
    }
  }

  if (result.host.empty() || result.host.find_first_of(" \t\r\n") != std::string::npos) {
    return std::nullopt;
  }
  result.host = to_lower(result.host);

  if (!port_str.empty()) {
    if (port_str.size() > 5 || !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
      return std::nullopt;
    }
    unsigned long port = std::stoul(port_str);
    if (port == 0 || port > 65535) {
      return std::nullopt;
    }
    result.port = static_cast<uint16_t>(port);
  }

  auto question = path_and_query.find('?');
  if (question != std::string::npos) {
    result.path = path_and_query.substr(0, question);
    result.query = path_and_query.substr(question + 1);
  } else {
    result.path = path_and_query;
  }
  if (result.path.empty()) {
    result.path = "/";
  }
  if (result.path.find_first_of(" \r\n") != std::string::npos || result.query.find_first_of(" \r\n") != std::string::npos) {
    return std::nullopt;
  }

  return result;
}

std::optional<Url> Url::resolve(const Url& base, const std::string& reference) {
  std::string ref = reference;
  ref.erase(0, ref.find_first_not_of(" \t"));
  ref.erase(ref.find_last_not_of(" \t\r\n") + 1);
  if (ref.empty()) {
    return std::nullopt;
  }
  ref = encode_reference(ref);

  auto hash = ref.find('#');
  if (hash != std::string::npos) {
    ref.erase(hash);
  }
  if (ref.empty()) {
    Url same = base;
    same.userinfo.clear();
    return same;
  }

  // Absolute reference
  auto scheme_end = ref.find("://");
  if (scheme_end != std::string::npos && ref.find_first_of("/?") > scheme_end) {
    return parse(ref);
  }

  // Scheme-relative
  if (ref.rfind("//", 0) == 0) {
    return parse(base.scheme + ":" + ref);
  }

  Url result = base;
  result.userinfo.clear();

  if (ref[0] == '?') {
    result.query = ref.substr(1);
    return result;
  }

  std::string path = ref;
  std::string query;
  auto question = ref.find('?');
  if (question != std::string::npos) {
    path = ref.substr(0, question);
    query = ref.substr(question + 1);
  }

  if (path[0] != '/') {
    // Merge with the base path's directory
    auto last_slash = base.path.rfind('/');
    path = (last_slash == std::string::npos ? "/" : base.path.substr(0, last_slash + 1)) + path;
  }

  result.path = remove_dot_segments(path);
  result.query = query;
  return result;
}

std::string percent_encode(const std::string& value) {
  static const char* hex = "0123456789ABCDEF";
  std::string result;
  result.reserve(value.size());
  for (unsigned char c : value) {
    if (is_unreserved(c)) {
      result += static_cast<char>(c);
    } else {
      result += '%';
      result += hex[c >> 4];
      result += hex[c & 0x0F];
    }
  }
  return result;
}

std::string percent_decode(const std::string& value) {
  std::string result;
  result.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size()) {
      int hi = hex_value(value[i + 1]);
      int lo = hex_value(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        result += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    result += value[i];
  }
  return result;
}

ConnectionKey ConnectionKey::from_url(const Url& url, const std::string& proxy, bool insecure) {
  return ConnectionKey{url.scheme, url.host, url.port_or_default(), proxy, insecure && url.is_https()};
}

std::string ConnectionKey::to_string() const {
  std::string result = scheme + "://" + (host.find(':') != std::string::npos ? "[" + host + "]" : host) + ":" + std::to_string(port);
  if (!proxy.empty()) {
    result += " via " + proxy;
  }
  if (insecure) {
    result += " (insecure)";
  }
  return result;
}

}  // namespace courier::net
