#pragma once

#include <string>
#include <string_view>

namespace relay::util {

/*
  Per-payload outcome codes.

  Failures local to one payload or destination are reported through these
  values and never unwind the loop that produced them.
*/
enum class ErrorCode {
  kOk = 0,

  kUnknownSubsystem,
  kInvalidArgument,

  // local disk problem, surfaced but not retried by the core
  kIOFailure,

  // remote side unavailable or slow, retryable up to the retry limit
  kTransportFailure,

  // destination holds a different file under the same name, terminal
  kContentConflict,

  kResourceExhausted,
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kUnknownSubsystem:
      return "unknown_subsystem";
    case ErrorCode::kInvalidArgument:
      return "invalid_argument";
    case ErrorCode::kIOFailure:
      return "io_failure";
    case ErrorCode::kTransportFailure:
      return "transport_failure";
    case ErrorCode::kContentConflict:
      return "content_conflict";
    case ErrorCode::kResourceExhausted:
      return "resource_exhausted";
  }
  return "unknown";
}

struct Status {
  ErrorCode   code = ErrorCode::kOk;
  std::string message;

  static Status Ok() {
    return {};
  }

  static Status Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::kOk;
  }
};

} // namespace relay::util
