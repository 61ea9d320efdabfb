#include "http/request_encoder.hpp"

#include <sstream>

#include "courier/net/connection.hpp"
#include "courier/net/multipart.hpp"
#include "courier/net/params.hpp"

namespace courier::http {

EncodedRequest RequestEncoder::encode(const Request& request, const net::Url& url, const EncodeOptions& options) {
  EncodedRequest encoded;
  Headers headers = request.headers;

  if (!request.form_params.is_null() && std::holds_alternative<std::monostate>(request.body)) {
    encoded.body = net::encode_params(request.form_params);
    if (!headers.contains("Content-Type")) {
      headers.set("Content-Type", "application/x-www-form-urlencoded");
    }
  } else if (auto* raw = std::get_if<std::string>(&request.body)) {
    encoded.body = *raw;
  } else if (auto* parts = std::get_if<std::vector<Part>>(&request.body)) {
    auto boundary = net::make_boundary();
    encoded.body = net::encode_multipart(*parts, boundary);
    headers.set("Content-Type", net::multipart_content_type(boundary));
  } else if (auto* source = std::get_if<BodySource>(&request.body)) {
    encoded.source = *source;
  }

  if (!headers.contains("Host")) {
    headers.set("Host", url.authority());
  }

  if (request.oauth_token) {
    headers.set("Authorization", "Bearer " + *request.oauth_token);
  } else if (request.basic_auth) {
    headers.set("Authorization", net::basic_credentials(request.basic_auth->user, request.basic_auth->password));
  } else if (!url.userinfo.empty() && !headers.contains("Authorization")) {
    headers.set("Authorization", net::basic_credentials_from_userinfo(url.userinfo));
  }

  if (options.proxy_authorization && !headers.contains("Proxy-Authorization")) {
    headers.set("Proxy-Authorization", *options.proxy_authorization);
  }

  headers.remove("Content-Length");
  headers.remove("Transfer-Encoding");
  if (encoded.source) {
    headers.set("Transfer-Encoding", "chunked");
  } else if (!encoded.body.empty() || request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
    headers.set("Content-Length", std::to_string(encoded.body.size()));
  }

  headers.set("Connection", options.keep_alive ? "keep-alive" : "close");

  std::ostringstream head;
  head << request.method << " " << (options.absolute_form ? url.scheme + "://" + url.authority() + url.target() : url.target()) << " HTTP/1.1\r\n";
  for (const auto& [name, value] : headers) {
    head << name << ": " << value << "\r\n";
  }
  head << "\r\n";
  encoded.head = head.str();
  return encoded;
}

std::string RequestEncoder::encode_chunk(const std::string& payload) {
  if (payload.empty()) {
    return "0\r\n\r\n";
  }
  std::ostringstream chunk;
  chunk << std::hex << payload.size() << "\r\n" << payload << "\r\n";
  return chunk.str();
}

}  // namespace courier::http
