#pragma once

#include <set>
#include <string>

#include "courier/http/request.hpp"
#include "courier/net/headers.hpp"
#include "courier/net/url.hpp"

namespace courier::http {

struct RedirectPolicy {
  std::set<int> statuses{301, 302, 303, 307, 308};
  bool rewrite_post_on_301_302 = true;  // 301/302 turn non-GET/HEAD into GET
};

struct RedirectDecision {
  enum class Action { Stop, Follow, LimitExceeded };

  Action action = Action::Stop;
  Request request;  // request for the next hop (Follow only)
  net::Url url;     // resolved Location (Follow and LimitExceeded)
  std::string reason;
};

class RedirectHandler {
 public:
  explicit RedirectHandler(RedirectPolicy policy = {}) : policy_(std::move(policy)) {}

  // hops: redirects already followed for this call
  RedirectDecision next(const Request& request, const net::Url& current, int status, const Headers& response_headers, int hops) const;

  bool is_redirect(int status) const {
    return policy_.statuses.count(status) > 0;
  }

  const RedirectPolicy& policy() const {
    return policy_;
  }

 private:
  RedirectPolicy policy_;
};

}  // namespace courier::http
