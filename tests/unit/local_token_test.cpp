#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "internal/token/authorization_digest.hpp"
#include "internal/token/local_token.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using agentpay::token::AuthorizationRejected;
using agentpay::token::Domain;
using agentpay::token::LocalToken;
using agentpay::token::TransferAuthorization;
using Reason = AuthorizationRejected::Reason;

const std::string kToken     = "0xA0B86991C6218B36C1D19D4A2E9EB0CE3606EB48";
const std::string kPayer     = "0x9a7e000000000000000000000000000000000001";
const std::string kRecipient = "0x5e77000000000000000000000000000000000001";
const std::string kKey       = "payer-key";

struct Fixture {
  std::shared_ptr<agentpay::util::ManualClock> clock = std::make_shared<agentpay::util::ManualClock>(1'000);
  LocalToken                                   token{Domain{"USD Coin", "2", 8453, kToken}, clock};

  Fixture() {
    token.Mint(kPayer, 500);
    token.SetSigningKey(kPayer, kKey);
  }

  TransferAuthorization Authorization(uint64_t value, char nonce_fill = '1', const std::string& key = kKey) {
    TransferAuthorization authorization;
    authorization.from         = kPayer;
    authorization.to           = kRecipient;
    authorization.value        = value;
    authorization.valid_after  = 900;
    authorization.valid_before = 1'100;
    authorization.nonce        = "0x" + std::string(64, nonce_fill);
    authorization.signature    = agentpay::token::SignAuthorization(token.domain(), authorization, key);
    return authorization;
  }
};

Reason RejectionOf(LocalToken& token, const TransferAuthorization& authorization) {
  try {
    token.TransferWithAuthorization(authorization);
  } catch (const AuthorizationRejected& e) {
    return e.reason();
  }
  assert(false && "authorization was accepted");
  return Reason::kInvalidArgument;
}

void TestAddressIsNormalizedVerifyingContract() {
  Fixture f;
  assert(f.token.Address() == "0xa0b86991c6218b36c1d19d4a2e9eb0ce3606eb48");
  assert(f.token.domain().verifying_contract == f.token.Address());
  assert(f.token.TotalSupply() == 500);
}

void TestValidAuthorizationMovesFundsOnce() {
  Fixture f;
  auto    authorization = f.Authorization(200);

  f.token.TransferWithAuthorization(authorization);
  assert(f.token.BalanceOf(kPayer) == 300);
  assert(f.token.BalanceOf(kRecipient) == 200);
  assert(f.token.IsAuthorizationUsed(kPayer, authorization.nonce));

  assert(RejectionOf(f.token, authorization) == Reason::kNonceUsed);
  assert(f.token.BalanceOf(kPayer) == 300);
}

void TestValidityWindowIsExclusive() {
  Fixture f;

  f.clock->Set(900);
  assert(RejectionOf(f.token, f.Authorization(1)) == Reason::kNotYetValid);

  f.clock->Set(1'100);
  assert(RejectionOf(f.token, f.Authorization(1)) == Reason::kExpired);

  f.clock->Set(901);
  f.token.TransferWithAuthorization(f.Authorization(1));
  assert(f.token.BalanceOf(kRecipient) == 1);
}

void TestSignatureMustMatchEveryField() {
  Fixture f;

  assert(RejectionOf(f.token, f.Authorization(10, '2', "other-key")) == Reason::kBadSignature);

  auto tampered  = f.Authorization(10, '3');
  tampered.value = 11;
  assert(RejectionOf(f.token, tampered) == Reason::kBadSignature);

  auto redirected = f.Authorization(10, '4');
  redirected.to   = "0x0000000000000000000000000000000000000bad";
  assert(RejectionOf(f.token, redirected) == Reason::kBadSignature);

  // a rejected authorization does not consume its nonce
  assert(!f.token.IsAuthorizationUsed(kPayer, tampered.nonce));
  assert(f.token.BalanceOf(kPayer) == 500);
}

void TestInsufficientFundsAndMalformedInput() {
  Fixture f;
  assert(RejectionOf(f.token, f.Authorization(501)) == Reason::kInsufficientFunds);

  auto malformed  = f.Authorization(1);
  malformed.nonce = "0x1234";
  assert(RejectionOf(f.token, malformed) == Reason::kInvalidArgument);
}

void TestPlainTransfer() {
  Fixture f;
  assert(f.token.Transfer(kPayer, kRecipient, 500));
  assert(!f.token.Transfer(kPayer, kRecipient, 1));
  assert(!f.token.Transfer(kRecipient, "0x0000000000000000000000000000000000000000", 1));
  assert(f.token.BalanceOf(kRecipient) == 500);
  assert(f.token.TotalSupply() == 500);
}

void TestMintRejectsSupplyOverflow() {
  Fixture f;
  bool    threw = false;
  try {
    f.token.Mint(kRecipient, std::numeric_limits<uint64_t>::max());
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(f.token.TotalSupply() == 500);
}

} // namespace

int main() {
  TestAddressIsNormalizedVerifyingContract();
  TestValidAuthorizationMovesFundsOnce();
  TestValidityWindowIsExclusive();
  TestSignatureMustMatchEveryField();
  TestInsufficientFundsAndMalformedInput();
  TestPlainTransfer();
  TestMintRejectsSupplyOverflow();

  std::cout << "agentpay_unit_local_token: pass\n";
  return 0;
}
