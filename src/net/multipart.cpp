#include "courier/net/multipart.hpp"

#include <random>
#include <sstream>

namespace courier::net {

namespace {

// Quote a header parameter value, escaping quotes and dropping line breaks
std::string quote(const std::string& value) {
  std::string result = "\"";
  for (char c : value) {
    if (c == '"') {
      result += "%22";
    } else if (c == '\r' || c == '\n') {
      continue;
    } else {
      result += c;
    }
  }
  return result + "\"";
}

}  // namespace

std::string make_boundary() {
  static const char* alphabet = "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 61);

  std::string boundary = "----courier";
  for (int i = 0; i < 24; ++i) {
    boundary += alphabet[dist(rng)];
  }
  return boundary;
}

std::string multipart_content_type(const std::string& boundary) {
  return "multipart/form-data; boundary=" + boundary;
}

std::string encode_multipart(const std::vector<Part>& parts, const std::string& boundary) {
  std::ostringstream out;
  for (const auto& part : parts) {
    out << "--" << boundary << "\r\n";
    out << "Content-Disposition: form-data; name=" << quote(part.name);
    if (part.filename) {
      out << "; filename=" << quote(*part.filename);
    }
    out << "\r\n";
    if (part.content_type) {
      out << "Content-Type: " << *part.content_type << "\r\n";
    } else if (part.filename) {
      out << "Content-Type: application/octet-stream\r\n";
    }
    out << "\r\n" << part.content << "\r\n";
  }
  out << "--" << boundary << "--\r\n";
  return out.str();
}

}  // namespace courier::net
