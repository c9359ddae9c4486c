#include <cassert>
#include <iostream>
#include <limits>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/ledger/revenue_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using agentpay::db::memory::MemoryRepository;
using agentpay::ledger::RevenueLedger;

const std::string kOwner    = "0x0b00000000000000000000000000000000000042";
const std::string kTreasury = "0x7ea5000000000000000000000000000000000001";

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestCreditAndDebit() {
  auto          repo = std::make_shared<MemoryRepository>();
  RevenueLedger ledger(repo);
  auto          tx = repo->Begin();

  assert(ledger.BalanceOf(*tx, kOwner) == 0);
  assert(ledger.Credit(*tx, kOwner, 9'750'000) == 9'750'000);
  assert(ledger.Credit(*tx, kOwner, 250) == 9'750'250);
  assert(ledger.Debit(*tx, kOwner, 250) == 9'750'000);
  assert(ledger.Debit(*tx, kOwner, 9'750'000) == 0);
  assert(ledger.BalanceOf(*tx, kOwner) == 0);
}

void TestDebitRejectsZeroAndOverdraw() {
  auto          repo = std::make_shared<MemoryRepository>();
  RevenueLedger ledger(repo);
  auto          tx = repo->Begin();

  ledger.Credit(*tx, kOwner, 100);
  assert(Throws<agentpay::util::InsufficientBalanceError>([&] { ledger.Debit(*tx, kOwner, 0); }));
  assert(Throws<agentpay::util::InsufficientBalanceError>([&] { ledger.Debit(*tx, kOwner, 101); }));
  assert(Throws<agentpay::util::InsufficientBalanceError>([&] { ledger.Debit(*tx, kTreasury, 1); }));
  assert(ledger.BalanceOf(*tx, kOwner) == 100);
}

void TestCreditOverflowIsRejected() {
  auto          repo = std::make_shared<MemoryRepository>();
  RevenueLedger ledger(repo);
  auto          tx = repo->Begin();

  ledger.Credit(*tx, kOwner, std::numeric_limits<uint64_t>::max());
  assert(Throws<agentpay::util::InvalidState>([&] { ledger.Credit(*tx, kOwner, 1); }));
  assert(ledger.BalanceOf(*tx, kOwner) == std::numeric_limits<uint64_t>::max());
}

void TestListIsOrderedByBeneficiary() {
  auto          repo = std::make_shared<MemoryRepository>();
  RevenueLedger ledger(repo);

  {
    auto tx = repo->Begin();
    ledger.Credit(*tx, kTreasury, 5);
    ledger.Credit(*tx, kOwner, 7);
    tx->Commit();
  }

  auto       tx       = repo->Begin();
  const auto balances = ledger.List(*tx);
  assert(balances.size() == 2);
  assert(balances[0].beneficiary == kOwner);
  assert(balances[0].balance == 7);
  assert(balances[1].beneficiary == kTreasury);
  assert(balances[1].balance == 5);
}

} // namespace

int main() {
  TestCreditAndDebit();
  TestDebitRejectsZeroAndOverdraw();
  TestCreditOverflowIsRejected();
  TestListIsOrderedByBeneficiary();

  std::cout << "agentpay_unit_revenue_ledger: pass\n";
  return 0;
}
