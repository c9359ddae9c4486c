#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "settlement_test_harness.hpp"
#include "internal/util/errors.hpp"

namespace {

using agentpay::testing::Harness;
using namespace agentpay::testing;

struct PreparedSettlement {
  agentpay::settlement::v1::PaymentReceipt     receipt;
  agentpay::settlement::v1::AuthorizationProof proof;
};

void TestDistinctPaymentsAllSettle() {
  Harness h;

  constexpr int kThreads   = 8;
  constexpr int kPerThread = 5;

  // authorizations are signed up front; the harness nonce counter is not shared-safe
  std::vector<std::vector<PreparedSettlement>> work(kThreads);
  for (int t = 0; t < kThreads; ++t) {
    for (int i = 0; i < kPerThread; ++i) {
      const auto id = "receipt-" + std::to_string(t) + "-" + std::to_string(i);
      work[t].push_back({Harness::Receipt(id, kPerCallSku, kAgentId, kPayer, kPerCallPrice), h.Authorize(kPayer, kPerCallPrice)});
    }
  }

  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (const auto& item : work[t]) {
        try {
          h.engine->Settle(h.facilitator, item.receipt, item.proof);
        } catch (const std::exception&) {
          failures.fetch_add(1);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  constexpr uint64_t kTotal = kThreads * kPerThread;
  assert(failures.load() == 0);

  const auto entitlement = h.engine->GetEntitlement(kAgentId, kPayer);
  assert(entitlement.call_credits == kTotal);
  assert(h.engine->BalanceOf(kOwner) == kTotal * 9'750'000);
  assert(h.engine->BalanceOf(kTreasury) == kTotal * 250'000);
  assert(h.token->BalanceOf(kPayer) == kPayerFunding - kTotal * kPerCallPrice);

  const auto stats = h.engine->Stats();
  assert(stats.consumed_payments == kTotal);
  assert(stats.last_event_sequence == kTotal * 3);
}

void TestSamePaymentSettlesExactlyOnce() {
  Harness h;

  constexpr int                   kThreads = 8;
  std::vector<PreparedSettlement> attempts;
  for (int t = 0; t < kThreads; ++t) {
    // every attempt carries its own valid authorization; only the id collides
    attempts.push_back({Harness::Receipt("contested-receipt", kPerCallSku, kAgentId, kPayer, kPerCallPrice), h.Authorize(kPayer, kPerCallPrice)});
  }

  std::atomic<int>         successes{0};
  std::atomic<int>         replays{0};
  std::atomic<int>         other{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      try {
        h.engine->Settle(h.facilitator, attempts[t].receipt, attempts[t].proof);
        successes.fetch_add(1);
      } catch (const agentpay::util::ReplayError&) {
        replays.fetch_add(1);
      } catch (const std::exception&) {
        other.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(successes.load() == 1);
  assert(replays.load() == kThreads - 1);
  assert(other.load() == 0);

  assert(h.engine->GetEntitlement(kAgentId, kPayer).call_credits == 1);
  assert(h.token->BalanceOf(kPayer) == kPayerFunding - kPerCallPrice);
  assert(h.engine->Stats().consumed_payments == 1);
}

void TestReadsRunAlongsideWrites() {
  Harness h;
  h.SettlePerCall("seed-receipt");

  std::vector<PreparedSettlement> work;
  for (int i = 0; i < 20; ++i) {
    work.push_back({Harness::Receipt("parallel-" + std::to_string(i), kPerCallSku, kAgentId, kPayer, kPerCallPrice),
                    h.Authorize(kPayer, kPerCallPrice)});
  }

  std::atomic<bool> done{false};
  std::atomic<int>  denied{0};
  std::thread       writer([&] {
    for (const auto& item : work) {
      h.engine->Settle(h.facilitator, item.receipt, item.proof);
    }
    done.store(true);
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      uint64_t last_seen = 0;
      while (!done.load()) {
        if (!h.engine->HasAccess(kAgentId, kPayer)) {
          denied.fetch_add(1);
        }
        // credits only grow while nothing consumes them
        const auto credits = h.engine->GetEntitlement(kAgentId, kPayer).call_credits;
        assert(credits >= last_seen);
        last_seen = credits;
      }
    });
  }

  writer.join();
  for (auto& reader : readers) {
    reader.join();
  }

  assert(denied.load() == 0);
  assert(h.engine->GetEntitlement(kAgentId, kPayer).call_credits == 21);
}

} // namespace

int main() {
  TestDistinctPaymentsAllSettle();
  TestSamePaymentSettlesExactlyOnce();
  TestReadsRunAlongsideWrites();

  std::cout << "agentpay_unit_settlement_engine_concurrency: pass\n";
  return 0;
}
