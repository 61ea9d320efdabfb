#include "courier/http/request.hpp"

namespace courier::http {

BodyFilter max_body_size(size_t limit) {
  return [limit](size_t cumulative_bytes) { return cumulative_bytes <= limit; };
}

bool Request::has_body() const {
  return !std::holds_alternative<std::monostate>(body) || !form_params.is_null();
}

json Request::describe() const {
  json j;
  j["method"] = method;
  j["url"] = url;
  j["headers"] = headers.to_map();
  if (timeout_ms) j["timeout"] = *timeout_ms;
  if (connect_timeout_ms) j["connect_timeout"] = *connect_timeout_ms;
  if (keepalive_ms) j["keepalive"] = *keepalive_ms;
  if (max_redirects) j["max_redirects"] = *max_redirects;
  if (follow_redirects) j["follow_redirects"] = *follow_redirects;
  if (proxy) j["proxy"] = *proxy;
  if (basic_auth) j["basic_auth"] = basic_auth->user;
  if (oauth_token) j["oauth_token"] = "<redacted>";
  if (!query_params.is_null()) j["query_params"] = query_params;
  if (!form_params.is_null()) j["form_params"] = form_params;
  if (std::holds_alternative<std::vector<Part>>(body)) j["multipart"] = std::get<std::vector<Part>>(body).size();
  j["insecure"] = insecure;
  j["as"] = to_string(as);
  if (cancellation) j["cancellable"] = true;
  if (!extras.is_null()) j["extras"] = extras;
  return j;
}

}  // namespace courier::http
