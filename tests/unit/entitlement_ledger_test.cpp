#include <cassert>
#include <iostream>
#include <limits>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/entitlement_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using agentpay::db::memory::MemoryRepository;
using agentpay::ledger::EntitlementLedger;

const std::string kPayer = "0x9a7e000000000000000000000000000000000001";

void TestMissingRecordReadsEmpty() {
  auto              repo = std::make_shared<MemoryRepository>();
  EntitlementLedger ledger(repo);

  auto       tx     = repo->Begin();
  const auto record = ledger.Get(*tx, 42, kPayer);
  assert(record.agent_id == 42);
  assert(record.payer == kPayer);
  assert(record.call_credits == 0);
  assert(record.valid_until == 0);
  assert(ledger.Count(*tx) == 0);
  assert(!EntitlementLedger::HasAccess(record, 1'000));
}

void TestGrantAndConsumeCalls() {
  auto              repo = std::make_shared<MemoryRepository>();
  EntitlementLedger ledger(repo);

  {
    auto tx = repo->Begin();
    assert(ledger.GrantCall(*tx, 42, kPayer).call_credits == 1);
    assert(ledger.GrantCall(*tx, 42, kPayer).call_credits == 2);
    tx->Commit();
  }

  auto tx = repo->Begin();
  assert(ledger.Count(*tx) == 1);
  assert(ledger.ConsumeCall(*tx, 42, kPayer).call_credits == 1);
  assert(ledger.ConsumeCall(*tx, 42, kPayer).call_credits == 0);

  bool threw = false;
  try {
    ledger.ConsumeCall(*tx, 42, kPayer);
  } catch (const agentpay::util::NoCreditsError&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Get(*tx, 42, kPayer).call_credits == 0);

  // other agents are independent
  assert(ledger.Get(*tx, 43, kPayer).call_credits == 0);
}

void TestExtendPeriodStacksFromDeadline() {
  auto              repo = std::make_shared<MemoryRepository>();
  EntitlementLedger ledger(repo);
  auto              tx = repo->Begin();

  assert(ledger.ExtendPeriod(*tx, 42, kPayer, 100, 1'000).valid_until == 1'100);
  // renewal before expiry stacks on the deadline
  assert(ledger.ExtendPeriod(*tx, 42, kPayer, 100, 1'050).valid_until == 1'200);
  // renewal after expiry starts from now
  assert(ledger.ExtendPeriod(*tx, 42, kPayer, 100, 5'000).valid_until == 5'100);

  bool threw = false;
  try {
    ledger.ExtendPeriod(*tx, 42, kPayer, std::numeric_limits<uint64_t>::max(), 5'000);
  } catch (const agentpay::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Get(*tx, 42, kPayer).valid_until == 5'100);
}

void TestHasAccessPredicate() {
  agentpay::db::model::EntitlementRecord record;
  record.valid_until = 2'000;
  assert(EntitlementLedger::HasAccess(record, 1'999));
  assert(EntitlementLedger::HasAccess(record, 2'000));
  assert(!EntitlementLedger::HasAccess(record, 2'001));

  record.call_credits = 1;
  assert(EntitlementLedger::HasAccess(record, 9'999));
}

void TestRollbackDiscardsGrant() {
  auto              repo = std::make_shared<MemoryRepository>();
  EntitlementLedger ledger(repo);

  {
    auto tx = repo->Begin();
    ledger.GrantCall(*tx, 42, kPayer);
    tx->Rollback();
  }

  auto tx = repo->Begin();
  assert(ledger.Count(*tx) == 0);
}

} // namespace

int main() {
  TestMissingRecordReadsEmpty();
  TestGrantAndConsumeCalls();
  TestExtendPeriodStacksFromDeadline();
  TestHasAccessPredicate();
  TestRollbackDiscardsGrant();

  std::cout << "agentpay_unit_entitlement_ledger: pass\n";
  return 0;
}
