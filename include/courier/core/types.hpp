#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace courier {

using json = nlohmann::json;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

// Failure categories delivered through Response::error
enum class ErrorKind {
  ConnectError,        // DNS, TCP or TLS failure
  TimeoutError,        // Deadline exceeded at any stage
  ProtocolError,       // Malformed status line, headers or chunked framing
  SizeLimitError,      // Body filter rejected the response
  RedirectLimitError,  // Too many redirect hops
  CancelledError,      // Explicit cancellation
  InvalidRequest,      // Rejected before any I/O (bad URL, bad options)
  Shutdown             // Client or pool already shut down
};

std::string to_string(ErrorKind kind);

struct Error {
  ErrorKind kind = ErrorKind::ConnectError;
  std::string message;

  std::string describe() const {
    return to_string(kind) + ": " + message;
  }
};

inline Error make_error(ErrorKind kind, std::string message) {
  return Error{kind, std::move(message)};
}

// Output coercion for the response body
enum class Coercion {
  Stream,  // Deliver a BodyStream as soon as headers are parsed
  Bytes,   // Raw bytes
  Text,    // Decoded text (charset from Content-Type, else default charset)
  Auto     // Text for textual media types, bytes otherwise
};

std::string to_string(Coercion mode);

std::optional<Coercion> coercion_from_string(const std::string& str);

enum class ConnectionState { Idle, InUse, Closing, Closed };

std::string to_string(ConnectionState state);

// Per-attempt request pipeline state
enum class ExchangeState {
  Pending,
  Connecting,
  Writing,
  AwaitingResponse,
  ReadingHeaders,
  ReadingBody,
  Done,
  Failed,
  Cancelled
};

std::string to_string(ExchangeState state);

inline bool is_terminal(ExchangeState state) {
  return state == ExchangeState::Done || state == ExchangeState::Failed || state == ExchangeState::Cancelled;
}

// Sentinel for "keepalive disabled"
constexpr int64_t kKeepaliveDisabled = 0;

}  // namespace courier
