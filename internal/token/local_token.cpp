#include "internal/token/local_token.hpp"

#include <limits>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace agentpay::token {

using Reason = AuthorizationRejected::Reason;

LocalToken::LocalToken(Domain domain, std::shared_ptr<const util::Clock> clock)
    : domain_(std::move(domain)), address_(util::NormalizeAddress(domain_.verifying_contract)), clock_(std::move(clock)) {
  domain_.verifying_contract = address_;
}

void LocalToken::Mint(const std::string& to, uint64_t value) {
  const auto account = util::NormalizeAddress(to);

  std::scoped_lock lock(mutex_);
  if (value > std::numeric_limits<uint64_t>::max() - total_supply_) {
    throw util::InvalidArgument("mint would overflow total supply");
  }
  total_supply_ += value;
  balances_[account] += value;
}

void LocalToken::SetSigningKey(const std::string& account, std::string key) {
  if (key.empty()) {
    throw util::InvalidArgument("signing key must not be empty");
  }
  const auto normalized = util::NormalizeAddress(account);

  std::scoped_lock lock(mutex_);
  signing_keys_[normalized] = std::move(key);
}

std::string LocalToken::Address() const {
  return address_;
}

void LocalToken::TransferWithAuthorization(const TransferAuthorization& authorization) {
  TransferAuthorization normalized = authorization;
  try {
    normalized.from  = util::NormalizeAddress(authorization.from);
    normalized.to    = util::NormalizeAddress(authorization.to);
    normalized.nonce = util::NormalizeBytes32(authorization.nonce, "nonce");
  } catch (const util::InvalidArgument& e) {
    throw AuthorizationRejected(Reason::kInvalidArgument, e.what());
  }

  const auto digest = AuthorizationDigest(domain_, normalized);
  const auto now    = clock_->NowSeconds();

  std::scoped_lock lock(mutex_);
  if (now <= normalized.valid_after) {
    throw AuthorizationRejected(Reason::kNotYetValid, "authorization is not yet valid");
  }
  if (now >= normalized.valid_before) {
    throw AuthorizationRejected(Reason::kExpired, "authorization is expired");
  }
  if (used_authorizations_.contains({normalized.from, normalized.nonce})) {
    throw AuthorizationRejected(Reason::kNonceUsed, "authorization is used or canceled");
  }

  auto key = signing_keys_.find(normalized.from);
  if (key == signing_keys_.end() || !VerifyDigest(key->second, digest, normalized.signature)) {
    throw AuthorizationRejected(Reason::kBadSignature, "invalid signature");
  }

  auto balance = balances_.find(normalized.from);
  if (balance == balances_.end() || balance->second < normalized.value) {
    throw AuthorizationRejected(Reason::kInsufficientFunds, "transfer amount exceeds balance");
  }

  used_authorizations_.emplace(normalized.from, normalized.nonce);
  MoveLocked(normalized.from, normalized.to, normalized.value);
}

bool LocalToken::IsAuthorizationUsed(const std::string& from, const std::string& nonce) const {
  const auto account    = util::NormalizeAddress(from);
  const auto normalized = util::NormalizeBytes32(nonce, "nonce");

  std::scoped_lock lock(mutex_);
  return used_authorizations_.contains({account, normalized});
}

bool LocalToken::Transfer(const std::string& from, const std::string& to, uint64_t value) {
  const auto source      = util::NormalizeAddress(from);
  const auto destination = util::NormalizeAddress(to);
  if (util::IsZeroAddress(destination)) {
    return false;
  }

  std::scoped_lock lock(mutex_);
  auto             balance = balances_.find(source);
  if (balance == balances_.end() || balance->second < value) {
    return false;
  }
  MoveLocked(source, destination, value);
  return true;
}

uint64_t LocalToken::BalanceOf(const std::string& address) const {
  const auto account = util::NormalizeAddress(address);

  std::scoped_lock lock(mutex_);
  auto             it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

uint64_t LocalToken::TotalSupply() const {
  std::scoped_lock lock(mutex_);
  return total_supply_;
}

// total supply bounds every balance, so the credit cannot overflow
void LocalToken::MoveLocked(const std::string& from, const std::string& to, uint64_t value) {
  balances_[from] -= value;
  balances_[to] += value;
}

} // namespace agentpay::token
