#include "internal/events/stored_event_sink.hpp"

#include "internal/ledger/ledger_error.hpp"

namespace agentpay::events {

using agentpay::settlement::v1::SettlementEvent;

StoredEventSink::StoredEventSink(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void StoredEventSink::Publish(const SettlementEvent& event) {
  auto record = ToRecord(event);
  auto tx     = repository_->Begin();
  ledger::ThrowIfFailed(repository_->AppendEvent(*tx, record), "append settlement event");
  tx->Commit();
}

db::model::SettlementEventRecord StoredEventSink::ToRecord(const SettlementEvent& event) {
  db::model::SettlementEventRecord r;
  r.sequence     = event.sequence();
  r.kind         = event.kind();
  r.occurred_at  = event.occurred_at();
  r.payment_id   = event.payment_id();
  r.agent_id     = event.agent_id();
  r.sku_id       = event.sku_id();
  r.payer        = event.payer();
  r.beneficiary  = event.beneficiary();
  r.treasury     = event.treasury();
  r.amount       = event.amount();
  r.fee          = event.fee();
  r.net          = event.net();
  r.call_credits = event.call_credits();
  r.valid_until  = event.valid_until();
  r.detail       = event.detail();
  return r;
}

SettlementEvent StoredEventSink::ToProto(const db::model::SettlementEventRecord& r) {
  SettlementEvent event;
  event.set_sequence(r.sequence);
  event.set_kind(r.kind);
  event.set_occurred_at(r.occurred_at);
  event.set_payment_id(r.payment_id);
  event.set_agent_id(r.agent_id);
  event.set_sku_id(r.sku_id);
  event.set_payer(r.payer);
  event.set_beneficiary(r.beneficiary);
  event.set_treasury(r.treasury);
  event.set_amount(r.amount);
  event.set_fee(r.fee);
  event.set_net(r.net);
  event.set_call_credits(r.call_credits);
  event.set_valid_until(r.valid_until);
  event.set_detail(r.detail);
  return event;
}

} // namespace agentpay::events
