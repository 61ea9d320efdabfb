#include "courier/core/types.hpp"

namespace courier {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::ConnectError:
      return "ConnectError";
    case ErrorKind::TimeoutError:
      return "TimeoutError";
    case ErrorKind::ProtocolError:
      return "ProtocolError";
    case ErrorKind::SizeLimitError:
      return "SizeLimitError";
    case ErrorKind::RedirectLimitError:
      return "RedirectLimitError";
    case ErrorKind::CancelledError:
      return "CancelledError";
    case ErrorKind::InvalidRequest:
      return "InvalidRequest";
    case ErrorKind::Shutdown:
      return "Shutdown";
  }
  return "Unknown";
}

std::string to_string(Coercion mode) {
  switch (mode) {
    case Coercion::Stream:
      return "stream";
    case Coercion::Bytes:
      return "byte-array";
    case Coercion::Text:
      return "text";
    case Coercion::Auto:
      return "auto";
  }
  return "auto";
}

std::optional<Coercion> coercion_from_string(const std::string& str) {
  if (str == "stream") return Coercion::Stream;
  if (str == "byte-array" || str == "bytes") return Coercion::Bytes;
  if (str == "text") return Coercion::Text;
  if (str == "auto") return Coercion::Auto;
  return std::nullopt;
}

std::string to_string(ConnectionState state) {
  switch (state) {
    case ConnectionState::Idle:
      return "idle";
    case ConnectionState::InUse:
      return "in-use";
    case ConnectionState::Closing:
      return "closing";
    case ConnectionState::Closed:
      return "closed";
  }
  return "unknown";
}

std::string to_string(ExchangeState state) {
  switch (state) {
    case ExchangeState::Pending:
      return "pending";
    case ExchangeState::Connecting:
      return "connecting";
    case ExchangeState::Writing:
      return "writing";
    case ExchangeState::AwaitingResponse:
      return "awaiting-response";
    case ExchangeState::ReadingHeaders:
      return "reading-headers";
    case ExchangeState::ReadingBody:
      return "reading-body";
    case ExchangeState::Done:
      return "done";
    case ExchangeState::Failed:
      return "failed";
    case ExchangeState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

}  // namespace courier
