#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "settlement_test_harness.hpp"

namespace {

using agentpay::db::Repository;
using agentpay::db::Result;
using agentpay::db::Transaction;
using agentpay::db::memory::MemoryRepository;
using agentpay::testing::Harness;
using namespace agentpay::testing;
using namespace agentpay::settlement::v1;

template <typename Error, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

// Forwards to a memory repository; optionally fails revenue writes.
class HookedRepository : public Repository {
 public:
  bool fail_revenue_writes = false;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }
  bool IsPaymentConsumed(Transaction& tx, const std::string& id) override {
    return inner_.IsPaymentConsumed(tx, id);
  }
  Result InsertConsumedPayment(Transaction& tx, const agentpay::db::model::ConsumedPaymentRecord& r) override {
    return inner_.InsertConsumedPayment(tx, r);
  }
  uint64_t CountConsumedPayments(Transaction& tx) override {
    return inner_.CountConsumedPayments(tx);
  }
  std::optional<agentpay::db::model::EntitlementRecord> GetEntitlement(Transaction& tx, uint64_t agent_id, const std::string& payer) override {
    return inner_.GetEntitlement(tx, agent_id, payer);
  }
  Result UpsertEntitlement(Transaction& tx, const agentpay::db::model::EntitlementRecord& r) override {
    return inner_.UpsertEntitlement(tx, r);
  }
  uint64_t CountEntitlements(Transaction& tx) override {
    return inner_.CountEntitlements(tx);
  }
  std::optional<agentpay::db::model::RevenueBalanceRecord> GetRevenueBalance(Transaction& tx, const std::string& beneficiary) override {
    return inner_.GetRevenueBalance(tx, beneficiary);
  }
  Result UpsertRevenueBalance(Transaction& tx, const agentpay::db::model::RevenueBalanceRecord& r) override {
    if (fail_revenue_writes) {
      return Result::Err(agentpay::db::ErrorCode::IOError, "injected revenue write failure");
    }
    return inner_.UpsertRevenueBalance(tx, r);
  }
  std::vector<agentpay::db::model::RevenueBalanceRecord> ListRevenueBalances(Transaction& tx) override {
    return inner_.ListRevenueBalances(tx);
  }
  std::optional<agentpay::db::model::FeeConfigRecord> GetFeeConfig(Transaction& tx) override {
    return inner_.GetFeeConfig(tx);
  }
  Result PutFeeConfig(Transaction& tx, const agentpay::db::model::FeeConfigRecord& r) override {
    return inner_.PutFeeConfig(tx, r);
  }
  Result AppendEvent(Transaction& tx, agentpay::db::model::SettlementEventRecord& r) override {
    return inner_.AppendEvent(tx, r);
  }
  std::vector<agentpay::db::model::SettlementEventRecord> ReadEvents(Transaction& tx, uint64_t after, uint64_t max) override {
    return inner_.ReadEvents(tx, after, max);
  }
  uint64_t LastEventSequence(Transaction& tx) override {
    return inner_.LastEventSequence(tx);
  }

 private:
  MemoryRepository inner_;
};

// Token whose plain transfers always fail.
class RejectingTransferToken : public agentpay::token::TokenAuthorization {
 public:
  explicit RejectingTransferToken(std::shared_ptr<agentpay::token::LocalToken> inner) : inner_(std::move(inner)) {
  }
  std::string Address() const override {
    return inner_->Address();
  }
  void TransferWithAuthorization(const agentpay::token::TransferAuthorization& authorization) override {
    inner_->TransferWithAuthorization(authorization);
  }
  bool IsAuthorizationUsed(const std::string& from, const std::string& nonce) const override {
    return inner_->IsAuthorizationUsed(from, nonce);
  }
  bool Transfer(const std::string&, const std::string&, uint64_t) override {
    return false;
  }
  uint64_t BalanceOf(const std::string& address) const override {
    return inner_->BalanceOf(address);
  }

 private:
  std::shared_ptr<agentpay::token::LocalToken> inner_;
};

void TestPerCallSettlementSplitsFee() {
  Harness h;

  const auto result = h.SettlePerCall("receipt-1");
  assert(result.fee == 250'000);
  assert(result.net == 9'750'000);
  assert(result.beneficiary == kOwner);
  assert(result.payment_id.size() == 66);
  assert(result.entitlement.call_credits == 1);
  assert(result.entitlement.valid_until == 0);

  assert(h.engine->BalanceOf(kTreasury) == 250'000);
  assert(h.engine->BalanceOf(kOwner) == 9'750'000);
  assert(h.token->BalanceOf(kPayer) == kPayerFunding - kPerCallPrice);
  assert(h.token->BalanceOf(kSettlementAddress) == kPerCallPrice);
  assert(h.engine->HasAccess(kAgentId, kPayer));

  const auto events = h.engine->ListEvents(0, 0);
  assert(events.size() == 3);
  assert(events[0].sequence() == 1);
  assert(events[0].kind() == SETTLEMENT_EVENT_KIND_RECEIPT_ANCHORED);
  assert(events[1].kind() == SETTLEMENT_EVENT_KIND_ENTITLEMENT_GRANTED);
  assert(events[2].kind() == SETTLEMENT_EVENT_KIND_REVENUE_ACCRUED);
  assert(events[2].fee() == 250'000);
  assert(events[2].net() == 9'750'000);
  assert(events[2].beneficiary() == kOwner);
}

void TestAmountMismatchFailsBeforeFundsMove() {
  Harness h;

  ExpectThrows<agentpay::util::AmountMismatchError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("short-pay", kPerCallSku, kAgentId, kPayer, 9'000'000), h.Authorize(kPayer, 9'000'000));
  });

  assert(h.token->BalanceOf(kPayer) == kPayerFunding);
  assert(h.engine->BalanceOf(kOwner) == 0);
  assert(!h.engine->HasAccess(kAgentId, kPayer));

  // the id was burned before validation
  assert(h.engine->Stats().consumed_payments == 1);
  ExpectThrows<agentpay::util::ReplayError>([&] { h.SettlePerCall("short-pay"); });
}

void TestInactiveAndUnknownSkusAreRejected() {
  Harness h;
  h.skus->SetActive(kPerCallSku, false);

  ExpectThrows<agentpay::util::InactiveSkuError>([&] { h.SettlePerCall("inactive"); });
  ExpectThrows<agentpay::util::InactiveSkuError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("unknown-sku", 999, kAgentId, kPayer, kPerCallPrice), h.Authorize(kPayer, kPerCallPrice));
  });
  assert(h.token->BalanceOf(kPayer) == kPayerFunding);

  h.skus->SetActive(kPerCallSku, true);
  h.SettlePerCall("reactivated");
  assert(h.engine->HasAccess(kAgentId, kPayer));
}

void TestSkuTokenAndPayerValidation() {
  Harness h;

  ExpectThrows<agentpay::util::SkuMismatchError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("wrong-agent", kPerCallSku, 7, kPayer, kPerCallPrice), h.Authorize(kPayer, kPerCallPrice));
  });

  h.skus->CreateSku(Harness::MakeSku(3, kAgentId, LICENSE_TYPE_PER_CALL, kPerCallPrice, 0, "0x1111111111111111111111111111111111111111"));
  ExpectThrows<agentpay::util::WrongTokenError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("other-token", 3, kAgentId, kPayer, kPerCallPrice), h.Authorize(kPayer, kPerCallPrice));
  });

  ExpectThrows<agentpay::util::InvalidPayerError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("zero-payer", kPerCallSku, kAgentId, "0x0000000000000000000000000000000000000000", kPerCallPrice),
                     h.Authorize(kPayer, kPerCallPrice));
  });
  ExpectThrows<agentpay::util::InvalidPayerError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("empty-payer", kPerCallSku, kAgentId, "", kPerCallPrice), h.Authorize(kPayer, kPerCallPrice));
  });

  ExpectThrows<agentpay::util::InvalidPayerError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("bad-payer", kPerCallSku, kAgentId, "not-an-address", kPerCallPrice),
                     h.Authorize(kPayer, kPerCallPrice));
  });

  assert(h.engine->Stats().consumed_payments == 5);
  assert(h.token->BalanceOf(kPayer) == kPayerFunding);
}

void TestReplayTakesPrecedenceOverMalformedPayer() {
  Harness h;
  h.SettlePerCall("receipt-1");

  // a settled id stays a replay whatever payer the resubmission carries
  ExpectThrows<agentpay::util::ReplayError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("receipt-1", kPerCallSku, kAgentId, "bogus", kPerCallPrice),
                     h.Authorize(kPayer, kPerCallPrice));
  });
  ExpectThrows<agentpay::util::ReplayError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("receipt-1", kPerCallSku, kAgentId, "not-an-address", kPerCallPrice),
                     h.Authorize(kPayer, kPerCallPrice));
  });
  assert(h.engine->Stats().consumed_payments == 1);

  // a fresh id with a malformed payer is burned, then rejected as a bad payer
  ExpectThrows<agentpay::util::InvalidPayerError>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("receipt-2", kPerCallSku, kAgentId, "bogus", kPerCallPrice),
                     h.Authorize(kPayer, kPerCallPrice));
  });
  assert(h.engine->Stats().consumed_payments == 2);
  ExpectThrows<agentpay::util::ReplayError>([&] { h.SettlePerCall("receipt-2"); });

  assert(h.token->BalanceOf(kPayer) == kPayerFunding - kPerCallPrice);
  assert(h.engine->GetEntitlement(kAgentId, kPayer).call_credits == 1);
}

void TestOwnerTransferRoutesLaterRevenue() {
  Harness h;
  const std::string new_owner = "0x0b00000000000000000000000000000000000077";

  h.SettlePerCall("before-transfer");
  assert(h.identities->Transfer(kAgentId, new_owner) == kOwner);
  const auto after = h.SettlePerCall("after-transfer");
  assert(after.beneficiary == new_owner);

  // revenue accrued before the transfer stays with the previous owner
  assert(h.engine->BalanceOf(kOwner) == 9'750'000);
  assert(h.engine->BalanceOf(new_owner) == 9'750'000);
  assert(h.engine->BalanceOf(kTreasury) == 500'000);

  const auto events = h.engine->ListEvents(0, 0);
  assert(events.size() == 6);
  assert(events[2].kind() == SETTLEMENT_EVENT_KIND_REVENUE_ACCRUED);
  assert(events[2].beneficiary() == kOwner);
  assert(events[5].kind() == SETTLEMENT_EVENT_KIND_REVENUE_ACCRUED);
  assert(events[5].beneficiary() == new_owner);
  assert(events[5].net() == 9'750'000);
}

void TestSkuPricingTokenIsNormalizedOnCreate() {
  Harness h;

  const std::string upper  = "0xA0B86991C6218B36C1D19D4A2E9EB0CE3606EB48";
  const auto        stored = h.skus->CreateSku(Harness::MakeSku(6, kAgentId, LICENSE_TYPE_PER_CALL, kPerCallPrice, 0, upper));
  assert(stored.pricing_token() == kTokenAddress);
  assert(h.skus->GetSku(6).pricing_token() == kTokenAddress);

  // a checksummed token settles against the lowercase settlement token
  h.engine->Settle(h.facilitator, Harness::Receipt("upper-token", 6, kAgentId, kPayer, kPerCallPrice), h.Authorize(kPayer, kPerCallPrice));
  assert(h.engine->GetEntitlement(kAgentId, kPayer).call_credits == 1);

  ExpectThrows<agentpay::util::InvalidArgument>([&] {
    h.skus->CreateSku(Harness::MakeSku(7, kAgentId, LICENSE_TYPE_PER_CALL, kPerCallPrice, 0, "a0b86991c6218b36c1d19d4a2e9eb0ce3606eb48"));
  });
  ExpectThrows<agentpay::util::InvalidArgument>([&] {
    h.skus->CreateSku(Harness::MakeSku(7, kAgentId, LICENSE_TYPE_PER_CALL, kPerCallPrice, 0, "usdc"));
  });
  ExpectThrows<agentpay::util::NotFound>([&] { (void)h.skus->GetSku(7); });
}

void TestReplayIsRejectedForEquivalentIds() {
  Harness h;

  const std::string id = "0xAB" + std::string(62, 'c');
  h.SettlePerCall(id);
  ExpectThrows<agentpay::util::ReplayError>([&] { h.SettlePerCall(id); });

  std::string lower = id;
  lower[2]          = 'a';
  lower[3]          = 'b';
  ExpectThrows<agentpay::util::ReplayError>([&] { h.SettlePerCall(lower); });

  // only the first settlement moved funds
  assert(h.token->BalanceOf(kPayer) == kPayerFunding - kPerCallPrice);
  assert(h.engine->GetEntitlement(kAgentId, kPayer).call_credits == 1);
}

void TestFundsPullFailuresLeaveIdBurned() {
  Harness h;

  try {
    h.engine->Settle(h.facilitator, Harness::Receipt("forged", kPerCallSku, kAgentId, kPayer, kPerCallPrice),
                     h.Authorize(kPayer, kPerCallPrice, "not-the-payer-key"));
    assert(false);
  } catch (const agentpay::util::FundsPullError& e) {
    assert(e.reason() == "invalid_signature");
  }
  ExpectThrows<agentpay::util::ReplayError>([&] { h.SettlePerCall("forged"); });

  auto expired = h.Authorize(kPayer, kPerCallPrice);
  h.clock->Advance(7200);
  try {
    h.engine->Settle(h.facilitator, Harness::Receipt("expired", kPerCallSku, kAgentId, kPayer, kPerCallPrice), expired);
    assert(false);
  } catch (const agentpay::util::FundsPullError& e) {
    assert(e.reason() == "authorization_expired");
  }

  // one authorization cannot fund two receipts
  auto proof = h.Authorize(kPayer, kPerCallPrice);
  h.engine->Settle(h.facilitator, Harness::Receipt("first", kPerCallSku, kAgentId, kPayer, kPerCallPrice), proof);
  try {
    h.engine->Settle(h.facilitator, Harness::Receipt("second", kPerCallSku, kAgentId, kPayer, kPerCallPrice), proof);
    assert(false);
  } catch (const agentpay::util::FundsPullError& e) {
    assert(e.reason() == "authorization_used");
  }

  assert(h.token->BalanceOf(kPayer) == kPayerFunding - kPerCallPrice);
  assert(h.engine->Stats().consumed_payments == 4);
}

void TestUnknownAgentOwnerFailsBeforePull() {
  Harness h;
  h.skus->CreateSku(Harness::MakeSku(5, 77, LICENSE_TYPE_PER_CALL, kPerCallPrice, 0));

  ExpectThrows<agentpay::util::NotFound>([&] {
    h.engine->Settle(h.facilitator, Harness::Receipt("orphan", 5, 77, kPayer, kPerCallPrice), h.Authorize(kPayer, kPerCallPrice));
  });
  assert(h.token->BalanceOf(kPayer) == kPayerFunding);
}

void TestPerPeriodExtendsFromLaterOfNowAndDeadline() {
  Harness h;

  auto first = h.SettlePerPeriod("period-1");
  assert(first.entitlement.valid_until == kStartTime + kPeriodSeconds);
  assert(first.entitlement.call_credits == 0);
  assert(h.engine->HasAccess(kAgentId, kPayer));

  h.clock->Advance(kPeriodSeconds / 2);
  auto renewed = h.SettlePerPeriod("period-2");
  assert(renewed.entitlement.valid_until == kStartTime + 2 * kPeriodSeconds);

  // valid_until itself still grants access
  h.clock->Set(kStartTime + 2 * kPeriodSeconds);
  assert(h.engine->HasAccess(kAgentId, kPayer));
  h.clock->Advance(1);
  assert(!h.engine->HasAccess(kAgentId, kPayer));

  auto lapsed = h.SettlePerPeriod("period-3");
  assert(lapsed.entitlement.valid_until == h.clock->NowSeconds() + kPeriodSeconds);
}

void TestConsumeCallMetersCredits() {
  Harness h;
  h.SettlePerCall("call-1");
  h.SettlePerCall("call-2");
  assert(h.engine->GetEntitlement(kAgentId, kPayer).call_credits == 2);

  ExpectThrows<agentpay::util::Unauthenticated>([&] { h.engine->ConsumeCall(agentpay::auth::Principal::Anonymous(), kAgentId, kPayer); });
  ExpectThrows<agentpay::util::PermissionDenied>([&] { h.engine->ConsumeCall(h.owner, kAgentId, kPayer); });

  assert(h.engine->ConsumeCall(h.facilitator, kAgentId, kPayer).call_credits == 1);
  assert(h.engine->ConsumeCall(h.facilitator, kAgentId, kPayer).call_credits == 0);
  assert(!h.engine->HasAccess(kAgentId, kPayer));
  ExpectThrows<agentpay::util::NoCreditsError>([&] { h.engine->ConsumeCall(h.facilitator, kAgentId, kPayer); });
  assert(h.engine->GetEntitlement(kAgentId, kPayer).call_credits == 0);

  // an active period does not make calls meterable
  h.SettlePerPeriod("period");
  assert(h.engine->HasAccess(kAgentId, kPayer));
  ExpectThrows<agentpay::util::NoCreditsError>([&] { h.engine->ConsumeCall(h.facilitator, kAgentId, kPayer); });
}

void TestWithdrawPaysOutOwnBalance() {
  Harness h;
  h.SettlePerCall("withdraw-1");

  const std::string payout = "0x0b00000000000000000000000000000000000099";

  ExpectThrows<agentpay::util::Unauthenticated>([&] { h.engine->Withdraw(agentpay::auth::Principal::Anonymous(), payout, 1); });
  ExpectThrows<agentpay::util::PermissionDenied>([&] { h.engine->Withdraw(h.facilitator, payout, 1); });
  ExpectThrows<agentpay::util::InvalidArgument>([&] { h.engine->Withdraw(h.owner, "0x0000000000000000000000000000000000000000", 1); });
  ExpectThrows<agentpay::util::InsufficientBalanceError>([&] { h.engine->Withdraw(h.owner, payout, 0); });
  ExpectThrows<agentpay::util::InsufficientBalanceError>([&] { h.engine->Withdraw(h.owner, payout, 9'750'001); });

  assert(h.engine->Withdraw(h.owner, payout, 750'000) == 9'000'000);
  assert(h.token->BalanceOf(payout) == 750'000);
  assert(h.engine->Withdraw(h.owner, payout, 9'000'000) == 0);
  assert(h.token->BalanceOf(payout) == 9'750'000);
  assert(h.token->BalanceOf(kSettlementAddress) == 250'000);
  ExpectThrows<agentpay::util::InsufficientBalanceError>([&] { h.engine->Withdraw(h.owner, payout, 1); });

  // the admin principal has no revenue of its own
  ExpectThrows<agentpay::util::InsufficientBalanceError>([&] { h.engine->Withdraw(h.admin, payout, 1); });

  const auto events = h.engine->ListEvents(3, 0);
  assert(events.size() == 2);
  assert(events[0].kind() == SETTLEMENT_EVENT_KIND_REVENUE_WITHDRAWN);
  assert(events[0].detail() == payout);
}

void TestWithdrawTransferFailureKeepsBalance() {
  Harness h(nullptr, kDefaultFeeBps, [](std::shared_ptr<agentpay::token::LocalToken> local) {
    return std::make_shared<RejectingTransferToken>(std::move(local));
  });
  h.SettlePerCall("stuck-1");

  ExpectThrows<agentpay::util::TransferFailedError>([&] { h.engine->Withdraw(h.owner, kOwner, 1'000'000); });
  assert(h.engine->BalanceOf(kOwner) == 9'750'000);
  assert(h.token->BalanceOf(kSettlementAddress) == kPerCallPrice);
  assert(h.engine->Stats().last_event_sequence == 3);
}

void TestFeeAdministration() {
  Harness h;

  ExpectThrows<agentpay::util::PermissionDenied>([&] { h.engine->SetFeeBasisPoints(h.facilitator, 100); });
  ExpectThrows<agentpay::util::Unauthenticated>([&] { h.engine->SetTreasury(agentpay::auth::Principal::Anonymous(), kOwner); });
  ExpectThrows<agentpay::util::FeeTooHighError>([&] { h.engine->SetFeeBasisPoints(h.admin, 2001); });
  assert(h.engine->GetFeeConfig().fee_basis_points == kDefaultFeeBps);

  assert(h.engine->SetFeeBasisPoints(h.admin, 2000).fee_basis_points == 2000);
  auto capped = h.SettlePerCall("capped");
  assert(capped.fee == 2'000'000);
  assert(capped.net == 8'000'000);

  const std::string new_treasury = "0x7EA5000000000000000000000000000000000002";
  assert(h.engine->SetTreasury(h.admin, new_treasury).treasury == "0x7ea5000000000000000000000000000000000002");
  h.SettlePerCall("new-treasury");
  assert(h.engine->BalanceOf(new_treasury) == 2'000'000);
  assert(h.engine->BalanceOf(kTreasury) == 2'000'000);

  h.engine->SetFeeBasisPoints(h.admin, 0);
  auto free = h.SettlePerCall("no-fee");
  assert(free.fee == 0);
  assert(free.net == kPerCallPrice);
  assert(h.engine->BalanceOf(new_treasury) == 2'000'000);
  assert(h.engine->BalanceOf(kOwner) == 8'000'000 * 2 + kPerCallPrice);
}

void TestLedgerFailureRollsBackEntitlementAndRevenue() {
  auto repo = std::make_shared<HookedRepository>();
  Harness h(repo);

  repo->fail_revenue_writes = true;
  bool threw                = false;
  try {
    h.SettlePerCall("ledger-failure");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  repo->fail_revenue_writes = false;
  assert(h.engine->GetEntitlement(kAgentId, kPayer).call_credits == 0);
  assert(h.engine->BalanceOf(kOwner) == 0);
  assert(h.engine->Stats().consumed_payments == 1);
  ExpectThrows<agentpay::util::ReplayError>([&] { h.SettlePerCall("ledger-failure"); });
}

void TestStatsAggregateLedgers() {
  Harness h;
  h.SettlePerCall("stats-1");
  h.SettlePerPeriod("stats-2");

  const auto stats = h.engine->Stats();
  assert(stats.consumed_payments == 2);
  assert(stats.entitlement_records == 1);
  assert(stats.beneficiaries == 2);
  assert(stats.outstanding_revenue == kPerCallPrice + kPerPeriodPrice);
  assert(stats.last_event_sequence == 6);

  assert(h.engine->ListEvents(4, 2).size() == 2);
  assert(h.engine->ListEvents(6, 0).empty());
}

void TestSettleRequiresFacilitator() {
  Harness h;
  ExpectThrows<agentpay::util::Unauthenticated>([&] {
    h.engine->Settle(agentpay::auth::Principal::Anonymous(), Harness::Receipt("anon", kPerCallSku, kAgentId, kPayer, kPerCallPrice),
                     h.Authorize(kPayer, kPerCallPrice));
  });
  ExpectThrows<agentpay::util::PermissionDenied>([&] {
    h.engine->Settle(h.admin, Harness::Receipt("admin", kPerCallSku, kAgentId, kPayer, kPerCallPrice), h.Authorize(kPayer, kPerCallPrice));
  });
  // rejected callers never burn ids
  assert(h.engine->Stats().consumed_payments == 0);
}

} // namespace

int main() {
  TestPerCallSettlementSplitsFee();
  TestAmountMismatchFailsBeforeFundsMove();
  TestInactiveAndUnknownSkusAreRejected();
  TestSkuTokenAndPayerValidation();
  TestReplayTakesPrecedenceOverMalformedPayer();
  TestOwnerTransferRoutesLaterRevenue();
  TestSkuPricingTokenIsNormalizedOnCreate();
  TestReplayIsRejectedForEquivalentIds();
  TestFundsPullFailuresLeaveIdBurned();
  TestUnknownAgentOwnerFailsBeforePull();
  TestPerPeriodExtendsFromLaterOfNowAndDeadline();
  TestConsumeCallMetersCredits();
  TestWithdrawPaysOutOwnBalance();
  TestWithdrawTransferFailureKeepsBalance();
  TestFeeAdministration();
  TestLedgerFailureRollsBackEntitlementAndRevenue();
  TestStatsAggregateLedgers();
  TestSettleRequiresFacilitator();

  std::cout << "agentpay_unit_settlement_engine: pass\n";
  return 0;
}
