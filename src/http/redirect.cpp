#include "courier/http/redirect.hpp"

#include <spdlog/spdlog.h>

namespace courier::http {

namespace {

bool same_origin(const net::Url& a, const net::Url& b) {
  return a.scheme == b.scheme && a.host == b.host && a.port_or_default() == b.port_or_default();
}

void drop_body(Request& request) {
  request.body = std::monostate{};
  request.form_params = nullptr;
  request.headers.remove("Content-Type");
  request.headers.remove("Content-Length");
  request.headers.remove("Transfer-Encoding");
}

}  // namespace

RedirectDecision RedirectHandler::next(const Request& request, const net::Url& current, int status, const Headers& response_headers,
                                       int hops) const {
  RedirectDecision decision;
  if (!request.follow_redirects.value_or(true) || !is_redirect(status)) {
    return decision;
  }

  auto location = response_headers.get("Location");
  if (!location || location->empty()) {
    decision.reason = "redirect without Location";
    return decision;
  }

  auto target = net::Url::resolve(current, *location);
  if (!target) {
    spdlog::warn("Ignoring unresolvable redirect Location '{}' from {}", *location, current.to_string());
    decision.reason = "unresolvable Location";
    return decision;
  }
  decision.url = *target;

  if (hops >= request.max_redirects.value_or(0)) {
    decision.action = RedirectDecision::Action::LimitExceeded;
    decision.reason = "exceeded " + std::to_string(request.max_redirects.value_or(0)) + " redirects";
    return decision;
  }

  Request next = request;
  next.url = target->to_string();
  // Params were already folded into the previous URL
  next.query_params = nullptr;

  bool to_get = false;
  if (status == 303) {
    to_get = request.method != "HEAD";
  } else if ((status == 301 || status == 302) && policy_.rewrite_post_on_301_302) {
    to_get = request.method != "GET" && request.method != "HEAD";
  }

  if (to_get) {
    next.method = "GET";
    drop_body(next);
  } else if (std::holds_alternative<BodySource>(request.body)) {
    // A streamed body was consumed by the first attempt
    decision.reason = "streamed body cannot be replayed";
    return decision;
  }

  if (!same_origin(current, *target)) {
    next.headers.remove("Authorization");
    next.headers.remove("Cookie");
    next.headers.remove("Proxy-Authorization");
    next.basic_auth.reset();
    next.oauth_token.reset();
  }
  next.headers.remove("Host");

  spdlog::debug("Redirect {} {} -> {} {}", status, current.to_string(), next.method, next.url);
  decision.action = RedirectDecision::Action::Follow;
  decision.request = std::move(next);
  return decision;
}

}  // namespace courier::http
