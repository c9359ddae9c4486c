#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace agentpay::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthenticated : public std::runtime_error {
 public:
  explicit Unauthenticated(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Settlement errors. Every one is terminal for the call that raised it.
// ---------------------------------------------------------------------

// paymentId already consumed; the same id can never settle again.
class ReplayError : public std::runtime_error {
 public:
  explicit ReplayError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InactiveSkuError : public std::runtime_error {
 public:
  explicit InactiveSkuError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SkuMismatchError : public std::runtime_error {
 public:
  explicit SkuMismatchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class WrongTokenError : public std::runtime_error {
 public:
  explicit WrongTokenError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AmountMismatchError : public std::runtime_error {
 public:
  explicit AmountMismatchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidPayerError : public std::runtime_error {
 public:
  explicit InvalidPayerError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Wraps a rejection from the token authorization layer.
class FundsPullError : public std::runtime_error {
 public:
  FundsPullError(std::string reason, const std::string& msg) : std::runtime_error(msg), reason_(std::move(reason)) {
  }

  const std::string& reason() const {
    return reason_;
  }

 private:
  std::string reason_;
};

class NoCreditsError : public std::runtime_error {
 public:
  explicit NoCreditsError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientBalanceError : public std::runtime_error {
 public:
  explicit InsufficientBalanceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransferFailedError : public std::runtime_error {
 public:
  explicit TransferFailedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FeeTooHighError : public std::runtime_error {
 public:
  explicit FeeTooHighError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Short, stable name of an error class: the metric outcome label and the
// gRPC error detail. Anything unrecognized is "internal".
inline std::string ErrorReason(const std::exception& e) {
  if (dynamic_cast<const ReplayError*>(&e)) return "replay";
  if (dynamic_cast<const AlreadyExists*>(&e)) return "already_exists";
  if (dynamic_cast<const InactiveSkuError*>(&e)) return "inactive_sku";
  if (dynamic_cast<const SkuMismatchError*>(&e)) return "sku_mismatch";
  if (dynamic_cast<const WrongTokenError*>(&e)) return "wrong_token";
  if (dynamic_cast<const AmountMismatchError*>(&e)) return "amount_mismatch";
  if (dynamic_cast<const InvalidPayerError*>(&e)) return "invalid_payer";
  if (dynamic_cast<const FeeTooHighError*>(&e)) return "fee_too_high";
  if (dynamic_cast<const InvalidArgument*>(&e)) return "invalid_argument";
  if (dynamic_cast<const FundsPullError*>(&e)) return "funds_pull";
  if (dynamic_cast<const NoCreditsError*>(&e)) return "no_credits";
  if (dynamic_cast<const InsufficientBalanceError*>(&e)) return "insufficient_balance";
  if (dynamic_cast<const InvalidState*>(&e)) return "invalid_state";
  if (dynamic_cast<const TransferFailedError*>(&e)) return "transfer_failed";
  if (dynamic_cast<const NotFound*>(&e)) return "not_found";
  if (dynamic_cast<const PermissionDenied*>(&e)) return "permission_denied";
  if (dynamic_cast<const Unauthenticated*>(&e)) return "unauthenticated";
  return "internal";
}

} // namespace agentpay::util
