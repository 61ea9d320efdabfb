#include "http/response_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>

namespace courier::http {

namespace {

std::string trim(const std::string& str) {
  auto start = str.find_first_not_of(" \t");
  if (start == std::string::npos) return "";
  auto end = str.find_last_not_of(" \t");
  return str.substr(start, end - start + 1);
}

// Case-insensitive search for a token in a comma separated header value
bool has_token(const std::string& value, const std::string& token) {
  size_t start = 0;
  while (start <= value.size()) {
    auto comma = value.find(',', start);
    auto item = trim(value.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (net::iequals(item, token)) return true;
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return false;
}

bool parse_decimal(const std::string& str, uint64_t& out) {
  if (str.empty()) return false;
  uint64_t value = 0;
  for (char c : str) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    if (value > (std::numeric_limits<uint64_t>::max() - 9) / 10) return false;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  out = value;
  return true;
}

}  // namespace

std::string to_string(ResponseParser::State state) {
  switch (state) {
    case ResponseParser::State::StatusLine:
      return "StatusLine";
    case ResponseParser::State::Headers:
      return "Headers";
    case ResponseParser::State::Body:
      return "Body";
    case ResponseParser::State::ChunkSize:
      return "ChunkSize";
    case ResponseParser::State::ChunkData:
      return "ChunkData";
    case ResponseParser::State::ChunkDataCrlf:
      return "ChunkDataCrlf";
    case ResponseParser::State::Trailers:
      return "Trailers";
    case ResponseParser::State::UntilClose:
      return "UntilClose";
    case ResponseParser::State::Complete:
      return "Complete";
    case ResponseParser::State::Error:
      return "Error";
  }
  return "Unknown";
}

ResponseParser::FeedResult ResponseParser::feed(const char* data, size_t size) {
  if (state_ == State::Complete) return FeedResult::Complete;
  if (state_ == State::Error) return aborted_ ? FeedResult::Aborted : FeedResult::Error;

  bytes_received_ += size;
  size_t pos = 0;
  std::string line;

  while (pos < size && state_ != State::Complete && state_ != State::Error) {
    switch (state_) {
      case State::StatusLine:
        if (take_line(data, size, pos, line)) {
          // Tolerate stray CRLFs before the status line
          if (!line.empty()) handle_status_line(line);
        }
        break;

      case State::Headers:
        if (take_line(data, size, pos, line)) {
          if (line.empty()) {
            end_of_headers();
          } else {
            handle_header_line(line, headers_);
          }
        }
        break;

      case State::Body: {
        auto n = static_cast<size_t>(std::min<uint64_t>(remaining_, size - pos));
        if (!deliver(data + pos, n)) break;
        pos += n;
        remaining_ -= n;
        if (remaining_ == 0) state_ = State::Complete;
        break;
      }

      case State::ChunkSize:
        if (take_line(data, size, pos, line)) handle_chunk_size(line);
        break;

      case State::ChunkData: {
        auto n = static_cast<size_t>(std::min<uint64_t>(remaining_, size - pos));
        if (!deliver(data + pos, n)) break;
        pos += n;
        remaining_ -= n;
        if (remaining_ == 0) state_ = State::ChunkDataCrlf;
        break;
      }

      case State::ChunkDataCrlf:
        if (take_line(data, size, pos, line)) {
          if (!line.empty()) {
            fail("Missing CRLF after chunk data");
          } else {
            state_ = State::ChunkSize;
          }
        }
        break;

      case State::Trailers:
        if (take_line(data, size, pos, line)) {
          if (line.empty()) {
            state_ = State::Complete;
          } else {
            handle_header_line(line, trailers_);
          }
        }
        break;

      case State::UntilClose:
        if (!deliver(data + pos, size - pos)) break;
        pos = size;
        break;

      case State::Complete:
      case State::Error:
        break;
    }
  }

  if (state_ == State::Complete) return FeedResult::Complete;
  if (state_ == State::Error) return aborted_ ? FeedResult::Aborted : FeedResult::Error;
  return FeedResult::NeedMore;
}

ResponseParser::FeedResult ResponseParser::finish() {
  if (state_ == State::UntilClose) {
    state_ = State::Complete;
  }
  if (state_ == State::Complete) return FeedResult::Complete;
  if (state_ == State::Error) return aborted_ ? FeedResult::Aborted : FeedResult::Error;

  if (state_ == State::StatusLine && bytes_received_ == 0) {
    fail("Connection closed before any response byte");
  } else if (!headers_done_) {
    fail("Connection closed while reading response headers");
  } else {
    fail("Connection closed before the response body was complete (" + to_string(state_) + ")");
  }
  return FeedResult::Error;
}

bool ResponseParser::keep_alive() const {
  if (!headers_done_ || state_ == State::Error) return false;
  if (!chunked_ && content_length_ < 0 && !head_request_ && status_ != 204 && status_ != 304) {
    // Until-close framing
    return false;
  }

  auto connection = headers_.get_all("Connection");
  for (const auto& value : connection) {
    if (has_token(value, "close")) return false;
  }
  if (version_minor_ == 0) {
    for (const auto& value : connection) {
      if (has_token(value, "keep-alive")) return true;
    }
    return false;
  }
  return true;
}

bool ResponseParser::take_line(const char* data, size_t size, size_t& pos, std::string& line) {
  bool in_head = state_ == State::StatusLine || state_ == State::Headers;
  const void* found = std::memchr(data + pos, '\n', size - pos);
  size_t end = found ? static_cast<size_t>(static_cast<const char*>(found) - data) : size;

  line_.append(data + pos, end - pos);
  if (in_head) header_bytes_ += end - pos + (found ? 1 : 0);
  pos = found ? end + 1 : size;

  if ((in_head && header_bytes_ > max_header_bytes_) || line_.size() > max_header_bytes_) {
    return fail("Response header block exceeds " + std::to_string(max_header_bytes_) + " bytes");
  }
  if (!found) return false;

  if (!line_.empty() && line_.back() == '\r') line_.pop_back();
  line.swap(line_);
  line_.clear();
  return true;
}

bool ResponseParser::handle_status_line(const std::string& line) {
  // HTTP/1.1 200 OK
  if (line.size() < 12 || line.compare(0, 5, "HTTP/") != 0 || line[6] != '.' || line[8] != ' ') {
    return fail("Malformed status line: " + line.substr(0, 64));
  }
  if (line[5] != '1' || (line[7] != '0' && line[7] != '1')) {
    return fail("Unsupported HTTP version: " + line.substr(0, 8));
  }
  for (size_t i = 9; i < 12; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
      return fail("Malformed status code: " + line.substr(0, 64));
    }
  }
  if (line.size() > 12 && line[12] != ' ') {
    return fail("Malformed status line: " + line.substr(0, 64));
  }

  version_minor_ = line[7] - '0';
  status_ = std::stoi(line.substr(9, 3));
  reason_ = line.size() > 13 ? line.substr(13) : "";
  state_ = State::Headers;
  return true;
}

bool ResponseParser::handle_header_line(const std::string& line, Headers& target) {
  if (line[0] == ' ' || line[0] == '\t') {
    // Obsolete line folding: continuation of the previous header
    if (target.empty()) return fail("Header continuation without a header");
    auto last = target.end() - 1;
    auto name = last->first;
    auto values = target.get_all(name);
    auto joined = values.back() + " " + trim(line);
    values.back() = joined;
    target.remove(name);
    for (const auto& value : values) target.add(name, value);
    return true;
  }

  auto colon = line.find(':');
  if (colon == std::string::npos || colon == 0) {
    return fail("Malformed header line: " + line.substr(0, 64));
  }
  auto name = line.substr(0, colon);
  if (name.find_first_of(" \t") != std::string::npos) {
    return fail("Whitespace in header name: " + name);
  }
  target.add(name, trim(line.substr(colon + 1)));
  return true;
}

bool ResponseParser::end_of_headers() {
  if (status_ >= 100 && status_ < 200) {
    // Interim response, the real one follows
    headers_.clear();
    header_bytes_ = 0;
    status_ = 0;
    reason_.clear();
    state_ = State::StatusLine;
    return true;
  }

  headers_done_ = true;
  bool no_body = head_request_ || status_ == 204 || status_ == 304;

  if (!no_body) {
    auto te = headers_.get_all("Transfer-Encoding");
    if (!te.empty()) {
      auto last = te.back();
      auto comma = last.rfind(',');
      auto coding = trim(comma == std::string::npos ? last : last.substr(comma + 1));
      if (!net::iequals(coding, "chunked")) {
        return fail("Unsupported transfer coding: " + last);
      }
      chunked_ = true;
    } else {
      for (const auto& value : headers_.get_all("Content-Length")) {
        size_t start = 0;
        while (start <= value.size()) {
          auto comma = value.find(',', start);
          auto item = trim(value.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
          uint64_t length = 0;
          if (!parse_decimal(item, length) || length > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return fail("Invalid Content-Length: " + value);
          }
          if (content_length_ >= 0 && static_cast<uint64_t>(content_length_) != length) {
            return fail("Conflicting Content-Length values");
          }
          content_length_ = static_cast<int64_t>(length);
          if (comma == std::string::npos) break;
          start = comma + 1;
        }
      }
    }
  }

  if (on_headers_ && !on_headers_()) {
    aborted_ = true;
    state_ = State::Error;
    return false;
  }

  if (no_body) {
    state_ = State::Complete;
  } else if (chunked_) {
    state_ = State::ChunkSize;
  } else if (content_length_ >= 0) {
    remaining_ = static_cast<uint64_t>(content_length_);
    state_ = remaining_ == 0 ? State::Complete : State::Body;
  } else {
    state_ = State::UntilClose;
  }
  return true;
}

bool ResponseParser::handle_chunk_size(const std::string& line) {
  // Chunk extensions after ';' are ignored
  auto size_str = trim(line.substr(0, line.find(';')));
  if (size_str.empty()) return fail("Empty chunk size");

  uint64_t size = 0;
  for (char c : size_str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return fail("Invalid chunk size: " + size_str.substr(0, 32));
    }
    if (size > (std::numeric_limits<uint64_t>::max() >> 4)) {
      return fail("Chunk size overflow");
    }
    int digit = std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
    size = (size << 4) | static_cast<uint64_t>(digit);
  }

  if (size == 0) {
    state_ = State::Trailers;
  } else {
    remaining_ = size;
    state_ = State::ChunkData;
  }
  return true;
}

bool ResponseParser::deliver(const char* data, size_t size) {
  if (size == 0) return true;
  body_bytes_ += size;
  if (on_body_ && !on_body_(data, size)) {
    aborted_ = true;
    state_ = State::Error;
    return false;
  }
  return true;
}

bool ResponseParser::fail(std::string message) {
  error_ = std::move(message);
  state_ = State::Error;
  return false;
}

}  // namespace courier::http
