#pragma once

#include <string>
#include <utility>

namespace agentpay::db {

/*
  Outcome of a ledger write.

  Backends fold their native errors into these codes so the ledgers above
  never see pqxx or sqlite3 types. The one code callers branch on is
  AlreadyExists: a payment id that is already burned, or an event
  sequence that was taken. The rest surface as failures of the settlement.
*/

enum class ErrorCode {
  OK = 0,
  NotFound,
  AlreadyExists,
  Busy,                  // sqlite lock wait timed out
  ConstraintViolation,   // CHECK / NOT NULL rejected the row
  SerializationFailure,  // postgres aborted a concurrent writer
  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace agentpay::db
