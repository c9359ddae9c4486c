#pragma once

#include "internal/events/event_sink.hpp"

namespace agentpay::events {

// One structured INFO line per event.
class LogEventSink final : public EventSink {
 public:
  void Publish(const agentpay::settlement::v1::SettlementEvent& event) override;
};

} // namespace agentpay::events
