#pragma once

#include <optional>
#include <string>

#include "courier/http/request.hpp"
#include "courier/net/url.hpp"

namespace courier::http {

struct EncodedRequest {
  std::string head;    // request line and header block, CRLF terminated
  std::string body;    // fixed body (may be empty)
  BodySource source;   // set for streamed bodies, sent chunked after the head
};

struct EncodeOptions {
  bool absolute_form = false;                     // plaintext proxy: request line carries the full URL
  std::optional<std::string> proxy_authorization;
  bool keep_alive = true;
};

// Serializes a request for `url` (the request's own url field is not consulted)
class RequestEncoder {
 public:
  static EncodedRequest encode(const Request& request, const net::Url& url, const EncodeOptions& options);

  // One chunk of a chunked body; an empty payload produces the terminating chunk
  static std::string encode_chunk(const std::string& payload);
};

}  // namespace courier::http
