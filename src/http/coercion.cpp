#include "http/coercion.hpp"

#include <iconv.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>

#include "courier/net/headers.hpp"

namespace courier::http {

namespace {

std::string trim(const std::string& str) {
  auto start = str.find_first_not_of(" \t");
  if (start == std::string::npos) return "";
  auto end = str.find_last_not_of(" \t");
  return str.substr(start, end - start + 1);
}

std::string media_type_of(const std::string& content_type) {
  auto semi = content_type.find(';');
  return net::to_lower(trim(content_type.substr(0, semi)));
}

bool ends_with(const std::string& str, const std::string& suffix) {
  return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Owns an iconv conversion descriptor
class IconvHandle {
 public:
  IconvHandle(const char* to, const char* from) : cd_(iconv_open(to, from)) {}

  ~IconvHandle() {
    if (valid()) iconv_close(cd_);
  }

  IconvHandle(const IconvHandle&) = delete;
  IconvHandle& operator=(const IconvHandle&) = delete;

  bool valid() const {
    return cd_ != reinterpret_cast<iconv_t>(-1);
  }

  iconv_t get() const {
    return cd_;
  }

 private:
  iconv_t cd_;
};

}  // namespace

std::string charset_of(const std::string& content_type) {
  size_t pos = 0;
  while ((pos = content_type.find(';', pos)) != std::string::npos) {
    ++pos;
    auto next = content_type.find(';', pos);
    auto param = trim(content_type.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
    auto eq = param.find('=');
    if (eq != std::string::npos && net::iequals(trim(param.substr(0, eq)), "charset")) {
      auto value = trim(param.substr(eq + 1));
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      return value;
    }
  }
  return "";
}

bool is_text_media_type(const std::string& content_type) {
  auto media = media_type_of(content_type);
  if (media.empty()) return false;
  if (media.compare(0, 5, "text/") == 0) return true;
  if (ends_with(media, "+json") || ends_with(media, "+xml")) return true;

  return media == "application/json" || media == "application/xml" || media == "application/javascript" ||
         media == "application/ecmascript" || media == "application/x-javascript" ||
         media == "application/x-www-form-urlencoded";
}

std::optional<std::string> decode_text(const std::string& bytes, const std::string& charset, std::string* error) {
  auto fail = [error](std::string message) -> std::optional<std::string> {
    if (error) *error = std::move(message);
    return std::nullopt;
  };

  std::string from = charset.empty() ? "UTF-8" : charset;
  IconvHandle cd("UTF-8", from.c_str());
  if (!cd.valid()) {
    return fail("unsupported charset '" + from + "'");
  }

  char* in = const_cast<char*>(bytes.data());
  size_t in_left = bytes.size();
  std::string out(bytes.size() + 16, '\0');
  size_t used = 0;

  while (in_left > 0) {
    char* dest = &out[used];
    size_t dest_left = out.size() - used;
    size_t ret = iconv(cd.get(), &in, &in_left, &dest, &dest_left);
    used = out.size() - dest_left;
    if (ret != static_cast<size_t>(-1)) break;

    size_t offset = bytes.size() - in_left;
    switch (errno) {
      case E2BIG:
        out.resize(out.size() * 2);
        continue;
      case EILSEQ:
        return fail("invalid " + from + " sequence at byte " + std::to_string(offset));
      case EINVAL:
        return fail("truncated " + from + " sequence at byte " + std::to_string(offset));
      default:
        return fail(std::string("iconv failed: ") + std::strerror(errno));
    }
  }

  // Flush the shift state of stateful encodings
  out.resize(used + 16);
  char* dest = &out[used];
  size_t dest_left = out.size() - used;
  if (iconv(cd.get(), nullptr, nullptr, &dest, &dest_left) == static_cast<size_t>(-1)) {
    return fail(std::string("iconv failed: ") + std::strerror(errno));
  }
  out.resize(out.size() - dest_left);
  return out;
}

Body coerce(std::string bytes, Coercion mode, const std::string& content_type, const std::string& default_charset) {
  Body body;
  if (mode == Coercion::Bytes || (mode == Coercion::Auto && !is_text_media_type(content_type))) {
    body.kind = Body::Kind::Bytes;
    body.data = std::move(bytes);
    return body;
  }

  auto charset = charset_of(content_type);
  if (charset.empty()) charset = default_charset;

  std::string problem;
  auto text = decode_text(bytes, charset, &problem);
  if (!text) {
    spdlog::warn("Cannot decode body as text: {}; delivering it as bytes", problem);
    body.kind = Body::Kind::Bytes;
    body.data = std::move(bytes);
    body.decode_error = std::move(problem);
    return body;
  }

  body.kind = Body::Kind::Text;
  body.data = std::move(*text);
  body.charset = charset;
  return body;
}

}  // namespace courier::http
