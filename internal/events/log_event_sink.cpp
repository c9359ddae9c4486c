#include "internal/events/log_event_sink.hpp"

#include "internal/observability/logging.hpp"

namespace agentpay::events {

using namespace agentpay::settlement::v1;

void LogEventSink::Publish(const SettlementEvent& event) {
  using observability::StringField;
  using observability::UintField;

  const auto kind = SettlementEventKind_Name(event.kind());

  switch (event.kind()) {
    case SETTLEMENT_EVENT_KIND_RECEIPT_ANCHORED:
      AGENTPAY_LOG_INFO("receipt anchored", {StringField("kind", kind), StringField("payment_id", event.payment_id()),
                                             UintField("sku_id", event.sku_id()), UintField("agent_id", event.agent_id()),
                                             StringField("payer", event.payer()), UintField("amount", event.amount())});
      break;
    case SETTLEMENT_EVENT_KIND_ENTITLEMENT_GRANTED:
    case SETTLEMENT_EVENT_KIND_CALL_CONSUMED:
      AGENTPAY_LOG_INFO(event.kind() == SETTLEMENT_EVENT_KIND_CALL_CONSUMED ? "call consumed" : "entitlement granted",
                        {StringField("kind", kind), UintField("agent_id", event.agent_id()), StringField("payer", event.payer()),
                         UintField("call_credits", event.call_credits()), UintField("valid_until", event.valid_until())});
      break;
    case SETTLEMENT_EVENT_KIND_REVENUE_ACCRUED:
      AGENTPAY_LOG_INFO("revenue accrued", {StringField("kind", kind), StringField("payment_id", event.payment_id()),
                                            UintField("agent_id", event.agent_id()), StringField("beneficiary", event.beneficiary()),
                                            StringField("treasury", event.treasury()), UintField("net", event.net()),
                                            UintField("fee", event.fee())});
      break;
    case SETTLEMENT_EVENT_KIND_REVENUE_WITHDRAWN:
      AGENTPAY_LOG_INFO("revenue withdrawn", {StringField("kind", kind), StringField("beneficiary", event.beneficiary()),
                                              StringField("to", event.detail()), UintField("amount", event.amount())});
      break;
    case SETTLEMENT_EVENT_KIND_FEE_UPDATED:
    case SETTLEMENT_EVENT_KIND_TREASURY_UPDATED:
      AGENTPAY_LOG_INFO("fee config updated", {StringField("kind", kind), StringField("treasury", event.treasury()),
                                               StringField("detail", event.detail())});
      break;
    default:
      AGENTPAY_LOG_WARN("unknown settlement event", {StringField("kind", kind)});
      break;
  }
}

} // namespace agentpay::events
