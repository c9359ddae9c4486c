#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/token/authorization_digest.hpp"
#include "internal/token/token_authorization.hpp"
#include "internal/util/time.hpp"

namespace agentpay::token {

/*
  LocalToken

  In-process stablecoin ledger with transfer-with-authorization support,
  used when the service runs standalone. Its address is the domain's
  verifying contract.
*/
class LocalToken final : public TokenAuthorization {
 public:
  LocalToken(Domain domain, std::shared_ptr<const util::Clock> clock);

  const Domain& domain() const {
    return domain_;
  }

  // Throws InvalidArgument on total supply overflow.
  void Mint(const std::string& to, uint64_t value);

  // Raw key bytes used to verify this account's authorizations.
  void SetSigningKey(const std::string& account, std::string key);

  std::string Address() const override;
  void        TransferWithAuthorization(const TransferAuthorization& authorization) override;
  bool        IsAuthorizationUsed(const std::string& from, const std::string& nonce) const override;
  bool        Transfer(const std::string& from, const std::string& to, uint64_t value) override;
  uint64_t    BalanceOf(const std::string& address) const override;

  uint64_t TotalSupply() const;

 private:
  void MoveLocked(const std::string& from, const std::string& to, uint64_t value);

  Domain                             domain_;
  std::string                        address_;
  std::shared_ptr<const util::Clock> clock_;

  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, uint64_t>    balances_;
  std::unordered_map<std::string, std::string> signing_keys_;
  std::set<std::pair<std::string, std::string>> used_authorizations_;
  uint64_t                                     total_supply_ = 0;
};

} // namespace agentpay::token
