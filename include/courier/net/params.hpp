#pragma once

#include <string>

#include "courier/core/types.hpp"
#include "courier/net/url.hpp"

namespace courier::net {

// Encode query or form params.
// Nested objects use bracket notation: {"a": {"b": {"c": 5}}} -> "a[b][c]=5".
// Arrays repeat the key: {"a": [1, 2]} -> "a=1&a=2". null values encode as a bare key.
std::string encode_params(const json& params);

// Append encoded params to the URL's existing query
void append_query(Url& url, const json& params);

}  // namespace courier::net
