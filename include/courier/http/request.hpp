#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "courier/core/cancellation.hpp"
#include "courier/core/types.hpp"
#include "courier/net/headers.hpp"
#include "courier/net/multipart.hpp"

namespace courier::http {

using net::Headers;
using net::Part;

// Pull source for a streamed request body (sent chunked); std::nullopt ends the body.
// Called on the exchange's strand.
using BodySource = std::function<std::optional<std::string>()>;

// Evaluated with the cumulative body size as bytes arrive; returning false rejects the response
using BodyFilter = std::function<bool(size_t cumulative_bytes)>;

BodyFilter max_body_size(size_t limit);

using RequestBody = std::variant<std::monostate, std::string, BodySource, std::vector<Part>>;

struct BasicAuth {
  std::string user;
  std::string password;
};

// Request descriptor. Options left unset inherit the client defaults.
struct Request {
  std::string method = "GET";
  std::string url;
  Headers headers;
  RequestBody body;

  json query_params;  // appended to the URL query; null = none
  json form_params;   // urlencoded body; null = none

  std::optional<BasicAuth> basic_auth;
  std::optional<std::string> oauth_token;

  std::optional<int64_t> timeout_ms;          // connect + full response read
  std::optional<int64_t> connect_timeout_ms;  // connection acquisition only
  std::optional<int64_t> keepalive_ms;        // <= 0 disables reuse
  std::optional<int> max_redirects;
  std::optional<bool> follow_redirects;
  std::optional<std::string> proxy;  // http://[user:pass@]host:port

  bool insecure = false;
  Coercion as = Coercion::Auto;
  BodyFilter filter;
  std::shared_ptr<Cancellation> cancellation;  // cancel() fails the call with CancelledError


  json extras;  // caller keys echoed back in Response::opts

  bool has_body() const;

  // Option summary for logs and diagnostics; body contents are not included
  json describe() const;
};

}  // namespace courier::http
