/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_ERROR_H
#define GRIDLINK_ERROR_H

#include <stdint.h>
#include <string>

namespace gridlink {

// Failure taxonomy shared by every component.
// Per-message errors (PAYLOAD_PARSE, INVALID_CHUNK) are logged and the
// message dropped; the rest end an operation.
enum class ErrorCode : uint8_t {
  NONE = 0,
  TRANSPORT = 1,           // connect/publish/subscribe failure, fatal
  PAYLOAD_PARSE = 2,       // malformed message
  INVALID_CHUNK = 3,       // negative or malformed chunk index
  INCOMPLETE_TRANSFER = 4, // materialize before every index arrived
  TIMEOUT = 5,             // no terminal signal within the deadline
  DEVICE_ERROR = 6,        // device reported a failure, raw text kept
  ABORTED = 7,             // caller cancelled the operation
  NO_DEVICE = 8,           // discovery found nothing to talk to
  IO = 9,                  // local file or socket failure
  CONFIG = 10              // invalid configuration value
};

struct Error {
  ErrorCode code;
  std::string detail;

  Error() : code(ErrorCode::NONE), detail() {}
  Error(ErrorCode c, const std::string& d) : code(c), detail(d) {}

  bool ok() const { return code == ErrorCode::NONE; }
};

inline const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NONE:                return "none";
    case ErrorCode::TRANSPORT:           return "transport error";
    case ErrorCode::PAYLOAD_PARSE:       return "payload parse error";
    case ErrorCode::INVALID_CHUNK:       return "invalid chunk";
    case ErrorCode::INCOMPLETE_TRANSFER: return "incomplete transfer";
    case ErrorCode::TIMEOUT:             return "timeout";
    case ErrorCode::DEVICE_ERROR:        return "device error";
    case ErrorCode::ABORTED:             return "aborted";
    case ErrorCode::NO_DEVICE:           return "no device";
    case ErrorCode::IO:                  return "i/o error";
    case ErrorCode::CONFIG:              return "configuration error";
  }
  return "unknown";
}

}  // namespace gridlink

#endif  // GRIDLINK_ERROR_H
