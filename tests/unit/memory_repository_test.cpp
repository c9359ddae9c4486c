#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using agentpay::db::memory::MemoryRepository;
using agentpay::db::model::FeeConfigRecord;
using agentpay::db::model::RevenueBalanceRecord;

const std::string kTreasury = "0x" + std::string(39, '0') + "1";
const std::string kOwner    = "0x" + std::string(39, '0') + "2";

void TestSnapshotIsolation() {
  MemoryRepository repo;

  auto reader = repo.Begin();
  {
    auto writer = repo.Begin();
    assert(repo.UpsertRevenueBalance(*writer, RevenueBalanceRecord{kOwner, 500}));
    assert(repo.GetRevenueBalance(*writer, kOwner)->balance == 500);
    writer->Commit();
  }

  // the reader keeps the state it began on
  assert(!repo.GetRevenueBalance(*reader, kOwner).has_value());
  reader->Commit();
  assert(reader->IsCommitted());

  auto fresh = repo.Begin();
  assert(repo.GetRevenueBalance(*fresh, kOwner)->balance == 500);
  fresh->Rollback();
}

void TestConcurrentWritersConflict() {
  MemoryRepository repo;

  auto first  = repo.Begin();
  auto second = repo.Begin();
  assert(repo.PutFeeConfig(*first, FeeConfigRecord{250, kTreasury}));
  assert(repo.PutFeeConfig(*second, FeeConfigRecord{500, kTreasury}));
  first->Commit();

  bool conflicted = false;
  try {
    second->Commit();
  } catch (const agentpay::util::InvalidState&) {
    conflicted = true;
  }
  assert(conflicted);
  assert(!second->IsCommitted());

  auto check = repo.Begin();
  assert(repo.GetFeeConfig(*check)->fee_basis_points == 250);
  check->Rollback();
}

void TestFinishedTransactionRejectsReuse() {
  MemoryRepository repo;
  auto             tx = repo.Begin();
  tx->Commit();

  bool rejected = false;
  try {
    tx->Commit();
  } catch (const std::logic_error&) {
    rejected = true;
  }
  assert(rejected);

  rejected = false;
  try {
    (void)repo.PutFeeConfig(*tx, FeeConfigRecord{1, kTreasury});
  } catch (const std::logic_error&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestSnapshotIsolation();
  TestConcurrentWritersConflict();
  TestFinishedTransactionRejectsReuse();

  std::cout << "agentpay_unit_memory_repository: pass\n";
  return 0;
}
