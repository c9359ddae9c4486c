#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace agentpay::token {

/*
  Signed transfer authorization, the payer's off-chain consent for one pull.

  Addresses are normalized (0x + 40 lowercase hex), nonce is bytes32 hex,
  signature holds raw bytes.
*/
struct TransferAuthorization {
  std::string from;
  std::string to;
  uint64_t    value        = 0;
  uint64_t    valid_after  = 0;
  uint64_t    valid_before = 0;
  std::string nonce;
  std::string signature;
};

class AuthorizationRejected : public std::runtime_error {
 public:
  enum class Reason {
    kNotYetValid,
    kExpired,
    kNonceUsed,
    kBadSignature,
    kInsufficientFunds,
    kInvalidArgument,
  };

  AuthorizationRejected(Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  Reason reason() const {
    return reason_;
  }

  static const char* ReasonName(Reason reason) {
    switch (reason) {
      case Reason::kNotYetValid:
        return "authorization_not_yet_valid";
      case Reason::kExpired:
        return "authorization_expired";
      case Reason::kNonceUsed:
        return "authorization_used";
      case Reason::kBadSignature:
        return "invalid_signature";
      case Reason::kInsufficientFunds:
        return "insufficient_funds";
      case Reason::kInvalidArgument:
        return "invalid_argument";
    }
    return "unknown";
  }

 private:
  Reason reason_;
};

/*
  Token primitive consumed by the settlement engine.

  TransferWithAuthorization enforces its own validity window and its own
  per-(from, nonce) replay guard, independent of payment ids.
*/
class TokenAuthorization {
 public:
  virtual ~TokenAuthorization() = default;

  // Address the engine compares against a SKU's pricing token.
  virtual std::string Address() const = 0;

  // Throws AuthorizationRejected.
  virtual void TransferWithAuthorization(const TransferAuthorization& authorization) = 0;

  virtual bool IsAuthorizationUsed(const std::string& from, const std::string& nonce) const = 0;

  // false when the transfer could not be made
  virtual bool Transfer(const std::string& from, const std::string& to, uint64_t value) = 0;

  virtual uint64_t BalanceOf(const std::string& address) const = 0;
};

} // namespace agentpay::token
