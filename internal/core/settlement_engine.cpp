#include "internal/core/settlement_engine.hpp"

#include "internal/events/stored_event_sink.hpp"
#include "internal/ledger/ledger_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace agentpay::core {

using namespace agentpay::settlement::v1;

namespace {

// An empty payer reads as the zero address. A malformed payer is kept as
// submitted; it is rejected after the burn like any other bad receipt.
std::string CanonicalPayer(const std::string& payer) {
  if (payer.empty()) {
    return util::ZeroAddress();
  }
  return util::IsAddress(payer) ? util::NormalizeAddress(payer) : payer;
}

SettlementEvent MakeEvent(SettlementEventKind kind, uint64_t now) {
  SettlementEvent event;
  event.set_kind(kind);
  event.set_occurred_at(now);
  return event;
}

} // namespace

SettlementEngine::SettlementEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const registry::OwnershipRegistry> ownership,
                                   std::shared_ptr<const registry::SkuCatalog> skus, std::shared_ptr<token::TokenAuthorization> token,
                                   std::shared_ptr<const auth::AccessPolicy> access, std::shared_ptr<events::EventSink> events,
                                   std::shared_ptr<const util::Clock> clock, EngineConfig config)
    : repository_(std::move(repository)),
      ownership_(std::move(ownership)),
      skus_(std::move(skus)),
      token_(std::move(token)),
      access_(std::move(access)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      config_(std::move(config)),
      replay_guard_(repository_),
      entitlements_(repository_),
      revenue_(repository_) {
  config_.settlement_address = util::NormalizeAddress(config_.settlement_address);
  config_.token_address      = util::NormalizeAddress(config_.token_address);
  config_.initial_treasury   = util::NormalizeAddress(config_.initial_treasury);
}

void SettlementEngine::Bootstrap() {
  if (config_.initial_fee_basis_points > kMaxFeeBasisPoints) {
    throw util::FeeTooHighError("initial fee of " + std::to_string(config_.initial_fee_basis_points) + " bps exceeds the cap");
  }

  std::scoped_lock lock(write_mutex_);
  auto             tx     = repository_->Begin();
  auto             stored = repository_->GetFeeConfig(*tx);
  if (stored) {
    tx->Rollback();
    AGENTPAY_LOG_INFO("fee config loaded", {observability::UintField("fee_basis_points", stored->fee_basis_points),
                                            observability::StringField("treasury", stored->treasury)});
    return;
  }

  db::model::FeeConfigRecord initial{config_.initial_fee_basis_points, config_.initial_treasury};
  ledger::ThrowIfFailed(repository_->PutFeeConfig(*tx, initial), "seed fee config");
  tx->Commit();
  AGENTPAY_LOG_INFO("fee config seeded", {observability::UintField("fee_basis_points", initial.fee_basis_points),
                                          observability::StringField("treasury", initial.treasury)});
}

// ---------------------------------------------------------------------------
// Settlement
// ---------------------------------------------------------------------------

SettlementResult SettlementEngine::Settle(const auth::Principal& caller, const PaymentReceipt& receipt, const AuthorizationProof& proof) {
  access_->Require(caller, auth::Capability::kFacilitator, "settle");

  observability::SpanScope span("agentpay.engine.settle");
  span.SetAttribute("sku_id", receipt.sku_id());
  span.SetAttribute("agent_id", receipt.agent_id());
  span.SetAttribute("amount", receipt.amount());

  try {
    std::scoped_lock lock(write_mutex_);
    auto             result = SettleLocked(receipt, proof);
    observability::Metrics::Instance().RecordSettlement("ok");
    observability::Metrics::Instance().AddSettledVolume(receipt.amount(), result.fee);
    return result;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordSettlement(util::ErrorReason(e));
    throw;
  }
}

SettlementResult SettlementEngine::SettleLocked(const PaymentReceipt& receipt, const AuthorizationProof& proof) {
  const auto     payment_id = util::NormalizePaymentId(receipt.payment_id());
  const auto     payer      = CanonicalPayer(receipt.payer());
  const uint64_t amount     = receipt.amount();
  const uint64_t now        = clock_->NowSeconds();

  // 1-2: replay check and burn keyed on the payment id alone, durable before
  // anything external happens
  {
    auto tx = repository_->Begin();
    replay_guard_.Consume(*tx, {payment_id, payer, receipt.agent_id(), receipt.sku_id(), amount, now});
    tx->Commit();
  }

  try {
    // 3: SKU validation, an unknown sku counts as inactive
    const auto sku = skus_->FindSku(receipt.sku_id());
    if (!sku || !sku->active()) {
      throw util::InactiveSkuError("sku " + std::to_string(receipt.sku_id()) + " is not active");
    }
    if (sku->agent_id() != receipt.agent_id()) {
      throw util::SkuMismatchError("sku " + std::to_string(receipt.sku_id()) + " belongs to agent " + std::to_string(sku->agent_id()) +
                                   ", receipt names agent " + std::to_string(receipt.agent_id()));
    }
    if (sku->pricing_token() != config_.token_address) {
      throw util::WrongTokenError("sku " + std::to_string(receipt.sku_id()) + " is priced in " + sku->pricing_token() +
                                  ", settlement token is " + config_.token_address);
    }
    if (sku->price() != amount) {
      throw util::AmountMismatchError("amount " + std::to_string(amount) + " does not match sku price " + std::to_string(sku->price()));
    }
    if (!util::IsAddress(payer)) {
      throw util::InvalidPayerError("invalid payer '" + payer + "': expected 0x + 40 hex chars");
    }
    if (util::IsZeroAddress(payer)) {
      throw util::InvalidPayerError("payer must not be the zero address");
    }

    // 4: owner at settlement time, before funds move so an unknown agent
    // cannot strand a completed pull
    const auto owner = ownership_->OwnerOf(receipt.agent_id());

    // 5: funds pull
    token::TransferAuthorization authorization;
    authorization.from         = payer;
    authorization.to           = config_.settlement_address;
    authorization.value        = amount;
    authorization.valid_after  = proof.valid_after();
    authorization.valid_before = proof.valid_before();
    authorization.nonce        = proof.nonce();
    authorization.signature    = proof.signature();
    try {
      token_->TransferWithAuthorization(authorization);
    } catch (const token::AuthorizationRejected& e) {
      throw util::FundsPullError(token::AuthorizationRejected::ReasonName(e.reason()), std::string("funds pull rejected: ") + e.what());
    } catch (const util::InvalidArgument& e) {
      throw util::FundsPullError("invalid_argument", std::string("funds pull rejected: ") + e.what());
    }

    // 6: ledgers, all or nothing
    SettlementResult result;
    result.payment_id  = payment_id;
    result.beneficiary = owner;

    db::model::FeeConfigRecord fee_config;
    try {
      auto tx = repository_->Begin();
      if (sku->license_type() == LICENSE_TYPE_PER_PERIOD) {
        result.entitlement = entitlements_.ExtendPeriod(*tx, receipt.agent_id(), payer, sku->period_seconds(), now);
      } else {
        result.entitlement = entitlements_.GrantCall(*tx, receipt.agent_id(), payer);
      }

      fee_config       = LoadFeeConfig(*tx);
      const auto split = SplitFee(amount, fee_config.fee_basis_points);
      result.fee       = split.fee;
      result.net       = split.net;

      revenue_.Credit(*tx, owner, split.net);
      if (split.fee > 0) {
        revenue_.Credit(*tx, fee_config.treasury, split.fee);
      }
      tx->Commit();
    } catch (const std::exception& e) {
      AGENTPAY_LOG_ERROR("funds pulled but ledger update failed",
                         {observability::StringField("payment_id", payment_id), observability::StringField("payer", payer),
                          observability::UintField("amount", amount), observability::StringField("error", e.what())});
      throw;
    }

    // 7: events
    auto anchored = MakeEvent(SETTLEMENT_EVENT_KIND_RECEIPT_ANCHORED, now);
    anchored.set_payment_id(payment_id);
    anchored.set_sku_id(receipt.sku_id());
    anchored.set_agent_id(receipt.agent_id());
    anchored.set_payer(payer);
    anchored.set_amount(amount);
    Publish(anchored);

    auto granted = MakeEvent(SETTLEMENT_EVENT_KIND_ENTITLEMENT_GRANTED, now);
    granted.set_payment_id(payment_id);
    granted.set_sku_id(receipt.sku_id());
    granted.set_agent_id(receipt.agent_id());
    granted.set_payer(payer);
    granted.set_call_credits(result.entitlement.call_credits);
    granted.set_valid_until(result.entitlement.valid_until);
    granted.set_detail(LicenseType_Name(sku->license_type()));
    Publish(granted);

    auto accrued = MakeEvent(SETTLEMENT_EVENT_KIND_REVENUE_ACCRUED, now);
    accrued.set_payment_id(payment_id);
    accrued.set_agent_id(receipt.agent_id());
    accrued.set_beneficiary(owner);
    accrued.set_treasury(fee_config.treasury);
    accrued.set_amount(amount);
    accrued.set_fee(result.fee);
    accrued.set_net(result.net);
    Publish(accrued);

    return result;
  } catch (const std::exception& e) {
    AGENTPAY_LOG_WARN("settlement failed, payment id stays consumed",
                      {observability::StringField("payment_id", payment_id), observability::UintField("sku_id", receipt.sku_id()),
                       observability::StringField("error", e.what())});
    throw;
  }
}

// ---------------------------------------------------------------------------
// Access query and metering
// ---------------------------------------------------------------------------

bool SettlementEngine::HasAccess(uint64_t agent_id, const std::string& payer) const {
  return ledger::EntitlementLedger::HasAccess(GetEntitlement(agent_id, payer), clock_->NowSeconds());
}

db::model::EntitlementRecord SettlementEngine::GetEntitlement(uint64_t agent_id, const std::string& payer) const {
  const auto normalized = util::NormalizeAddress(payer);

  auto tx     = repository_->Begin();
  auto record = entitlements_.Get(*tx, agent_id, normalized);
  tx->Rollback();
  return record;
}

db::model::EntitlementRecord SettlementEngine::ConsumeCall(const auth::Principal& caller, uint64_t agent_id, const std::string& payer) {
  access_->Require(caller, auth::Capability::kFacilitator, "consume_call");
  const auto normalized = util::NormalizeAddress(payer);

  observability::SpanScope span("agentpay.engine.consume_call");
  span.SetAttribute("agent_id", agent_id);

  std::scoped_lock             lock(write_mutex_);
  db::model::EntitlementRecord record;
  try {
    auto tx = repository_->Begin();
    record  = entitlements_.ConsumeCall(*tx, agent_id, normalized);
    tx->Commit();
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordCallConsumed(util::ErrorReason(e));
    throw;
  }
  observability::Metrics::Instance().RecordCallConsumed("ok");

  auto event = MakeEvent(SETTLEMENT_EVENT_KIND_CALL_CONSUMED, clock_->NowSeconds());
  event.set_agent_id(agent_id);
  event.set_payer(normalized);
  event.set_call_credits(record.call_credits);
  event.set_valid_until(record.valid_until);
  Publish(event);
  return record;
}

// ---------------------------------------------------------------------------
// Withdrawal
// ---------------------------------------------------------------------------

uint64_t SettlementEngine::Withdraw(const auth::Principal& caller, const std::string& to, uint64_t amount) {
  if (!caller.authenticated) {
    throw util::Unauthenticated("withdraw requires an authenticated caller");
  }
  if (caller.address.empty()) {
    throw util::PermissionDenied("principal '" + caller.name + "' is not bound to a beneficiary address");
  }
  const auto beneficiary = util::NormalizeAddress(caller.address);
  const auto destination = util::NormalizeAddress(to);
  if (util::IsZeroAddress(destination)) {
    throw util::InvalidArgument("withdrawal destination must not be the zero address");
  }

  observability::SpanScope span("agentpay.engine.withdraw");
  span.SetAttribute("amount", amount);

  std::scoped_lock lock(write_mutex_);
  uint64_t         remaining = 0;
  try {
    auto tx   = repository_->Begin();
    remaining = revenue_.Debit(*tx, beneficiary, amount);

    bool transferred = false;
    try {
      transferred = token_->Transfer(config_.settlement_address, destination, amount);
    } catch (const std::exception& e) {
      tx->Rollback();
      throw util::TransferFailedError("withdrawal transfer of " + std::to_string(amount) + " to " + destination + " failed: " + e.what());
    }
    if (!transferred) {
      tx->Rollback();
      throw util::TransferFailedError("withdrawal transfer of " + std::to_string(amount) + " to " + destination + " was rejected");
    }

    try {
      tx->Commit();
    } catch (const std::exception& e) {
      AGENTPAY_LOG_ERROR("withdrawal transferred but debit commit failed",
                         {observability::StringField("beneficiary", beneficiary), observability::StringField("to", destination),
                          observability::UintField("amount", amount), observability::StringField("error", e.what())});
      throw;
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    observability::Metrics::Instance().RecordWithdrawal(util::ErrorReason(e), amount);
    throw;
  }
  observability::Metrics::Instance().RecordWithdrawal("ok", amount);

  auto event = MakeEvent(SETTLEMENT_EVENT_KIND_REVENUE_WITHDRAWN, clock_->NowSeconds());
  event.set_beneficiary(beneficiary);
  event.set_amount(amount);
  event.set_detail(destination);
  Publish(event);
  return remaining;
}

uint64_t SettlementEngine::BalanceOf(const std::string& beneficiary) const {
  const auto normalized = util::NormalizeAddress(beneficiary);

  auto       tx      = repository_->Begin();
  const auto balance = revenue_.BalanceOf(*tx, normalized);
  tx->Rollback();
  return balance;
}

// ---------------------------------------------------------------------------
// Administration
// ---------------------------------------------------------------------------

db::model::FeeConfigRecord SettlementEngine::SetFeeBasisPoints(const auth::Principal& caller, uint32_t fee_basis_points) {
  access_->Require(caller, auth::Capability::kAdmin, "set_fee_basis_points");
  if (fee_basis_points > kMaxFeeBasisPoints) {
    throw util::FeeTooHighError("fee of " + std::to_string(fee_basis_points) + " bps exceeds the " + std::to_string(kMaxFeeBasisPoints) +
                                " bps cap");
  }

  std::scoped_lock           lock(write_mutex_);
  db::model::FeeConfigRecord updated;
  uint32_t                   previous = 0;
  {
    auto tx                  = repository_->Begin();
    updated                  = LoadFeeConfig(*tx);
    previous                 = updated.fee_basis_points;
    updated.fee_basis_points = fee_basis_points;
    ledger::ThrowIfFailed(repository_->PutFeeConfig(*tx, updated), "update fee basis points");
    tx->Commit();
  }

  auto event = MakeEvent(SETTLEMENT_EVENT_KIND_FEE_UPDATED, clock_->NowSeconds());
  event.set_treasury(updated.treasury);
  event.set_detail("fee_basis_points " + std::to_string(previous) + " -> " + std::to_string(fee_basis_points) + " by " + caller.name);
  Publish(event);
  return updated;
}

db::model::FeeConfigRecord SettlementEngine::SetTreasury(const auth::Principal& caller, const std::string& treasury) {
  access_->Require(caller, auth::Capability::kAdmin, "set_treasury");
  const auto normalized = util::NormalizeAddress(treasury);

  std::scoped_lock           lock(write_mutex_);
  db::model::FeeConfigRecord updated;
  std::string                previous;
  {
    auto tx          = repository_->Begin();
    updated          = LoadFeeConfig(*tx);
    previous         = updated.treasury;
    updated.treasury = normalized;
    ledger::ThrowIfFailed(repository_->PutFeeConfig(*tx, updated), "update treasury");
    tx->Commit();
  }

  auto event = MakeEvent(SETTLEMENT_EVENT_KIND_TREASURY_UPDATED, clock_->NowSeconds());
  event.set_treasury(normalized);
  event.set_detail("treasury " + previous + " -> " + normalized + " by " + caller.name);
  Publish(event);
  return updated;
}

db::model::FeeConfigRecord SettlementEngine::GetFeeConfig() const {
  auto       tx     = repository_->Begin();
  const auto config = LoadFeeConfig(*tx);
  tx->Rollback();
  return config;
}

EngineStats SettlementEngine::Stats() const {
  EngineStats stats;

  auto tx                   = repository_->Begin();
  stats.consumed_payments   = replay_guard_.Count(*tx);
  stats.entitlement_records = entitlements_.Count(*tx);
  for (const auto& balance : revenue_.List(*tx)) {
    ++stats.beneficiaries;
    stats.outstanding_revenue += balance.balance;
  }
  stats.last_event_sequence = repository_->LastEventSequence(*tx);
  tx->Rollback();
  return stats;
}

std::vector<SettlementEvent> SettlementEngine::ListEvents(uint64_t after_sequence, uint64_t max_events) const {
  std::vector<db::model::SettlementEventRecord> records;
  {
    auto tx = repository_->Begin();
    records = repository_->ReadEvents(*tx, after_sequence, max_events);
    tx->Rollback();
  }

  std::vector<SettlementEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    events.push_back(events::StoredEventSink::ToProto(record));
  }
  return events;
}

db::model::FeeConfigRecord SettlementEngine::LoadFeeConfig(db::Transaction& tx) const {
  if (auto stored = repository_->GetFeeConfig(tx)) {
    return *stored;
  }
  return {config_.initial_fee_basis_points, config_.initial_treasury};
}

void SettlementEngine::Publish(const SettlementEvent& event) {
  if (events_) {
    events_->Publish(event);
  }
}

} // namespace agentpay::core
