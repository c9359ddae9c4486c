#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/replay_guard.hpp"
#include "internal/util/errors.hpp"

namespace {

using agentpay::db::memory::MemoryRepository;
using agentpay::db::model::ConsumedPaymentRecord;
using agentpay::ledger::ReplayGuard;

ConsumedPaymentRecord Record(const std::string& payment_id) {
  ConsumedPaymentRecord record;
  record.payment_id  = payment_id;
  record.payer       = "0x9a7e000000000000000000000000000000000001";
  record.agent_id    = 42;
  record.sku_id      = 1;
  record.amount      = 10'000'000;
  record.consumed_at = 1'700'000'000;
  return record;
}

void TestConsumeIsWriteOnce() {
  auto        repo = std::make_shared<MemoryRepository>();
  ReplayGuard guard(repo);
  const auto  id = "0x" + std::string(64, 'a');

  {
    auto tx = repo->Begin();
    assert(!guard.IsConsumed(*tx, id));
    guard.Consume(*tx, Record(id));
    assert(guard.IsConsumed(*tx, id));
    tx->Commit();
  }

  auto tx    = repo->Begin();
  bool threw = false;
  try {
    guard.Consume(*tx, Record(id));
  } catch (const agentpay::util::ReplayError&) {
    threw = true;
  }
  assert(threw);
  assert(guard.Count(*tx) == 1);
}

void TestRolledBackBurnIsNotConsumed() {
  auto        repo = std::make_shared<MemoryRepository>();
  ReplayGuard guard(repo);
  const auto  id = "0x" + std::string(64, 'b');

  {
    auto tx = repo->Begin();
    guard.Consume(*tx, Record(id));
    tx->Rollback();
  }

  auto tx = repo->Begin();
  assert(!guard.IsConsumed(*tx, id));
  assert(guard.Count(*tx) == 0);
}

} // namespace

int main() {
  TestConsumeIsWriteOnce();
  TestRolledBackBurnIsNotConsumed();

  std::cout << "agentpay_unit_replay_guard: pass\n";
  return 0;
}
