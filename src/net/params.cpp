#include "courier/net/params.hpp"

#include <vector>

namespace courier::net {

namespace {

std::string scalar_to_string(const json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

void encode_value(const std::string& prefix, const json& value, std::vector<std::string>& out) {
  if (value.is_object()) {
    for (auto it = value.begin(); it != value.end(); ++it) {
      encode_value(prefix + "[" + percent_encode(it.key()) + "]", it.value(), out);
    }
  } else if (value.is_array()) {
    for (const auto& item : value) {
      encode_value(prefix, item, out);
    }
  } else if (value.is_null()) {
    out.push_back(prefix);
  } else {
    out.push_back(prefix + "=" + percent_encode(scalar_to_string(value)));
  }
}

}  // namespace

std::string encode_params(const json& params) {
  if (!params.is_object()) {
    return "";
  }

  std::vector<std::string> pairs;
  for (auto it = params.begin(); it != params.end(); ++it) {
    encode_value(percent_encode(it.key()), it.value(), pairs);
  }

  std::string result;
  for (const auto& pair : pairs) {
    if (!result.empty()) result += '&';
    result += pair;
  }
  return result;
}

void append_query(Url& url, const json& params) {
  auto encoded = encode_params(params);
  if (encoded.empty()) return;
  if (url.query.empty()) {
    url.query = encoded;
  } else {
    url.query += "&" + encoded;
  }
}

}  // namespace courier::net
