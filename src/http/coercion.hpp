#pragma once

#include <optional>
#include <string>

#include "courier/core/types.hpp"
#include "courier/http/response.hpp"

namespace courier::http {

// "text/html; charset=ISO-8859-1" -> "ISO-8859-1"; empty when absent
std::string charset_of(const std::string& content_type);

// text/*, JSON, XML, JavaScript, +json/+xml suffixes and form-urlencoded
bool is_text_media_type(const std::string& content_type);

// Converts bytes in any charset iconv knows to UTF-8 (an empty charset means UTF-8).
// Returns std::nullopt for an unknown charset or an invalid or truncated byte sequence;
// the reason goes to *error when given.
std::optional<std::string> decode_text(const std::string& bytes, const std::string& charset, std::string* error = nullptr);

// Turns a fully read body into the requested representation.
// Stream is handled by the exchange and never reaches here.
// Text that cannot be decoded is delivered as Bytes with Body::decode_error set.
Body coerce(std::string bytes, Coercion mode, const std::string& content_type, const std::string& default_charset);

}  // namespace courier::http
