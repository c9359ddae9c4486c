#include "internal/events/event_bus.hpp"

#include "internal/observability/logging.hpp"

namespace agentpay::events {

void EventBus::Subscribe(std::shared_ptr<EventSink> sink) {
  std::scoped_lock lock(mutex_);
  sinks_.push_back(std::move(sink));
}

void EventBus::Publish(const agentpay::settlement::v1::SettlementEvent& event) {
  std::vector<std::shared_ptr<EventSink>> sinks;
  {
    std::scoped_lock lock(mutex_);
    sinks = sinks_;
  }

  for (const auto& sink : sinks) {
    try {
      sink->Publish(event);
    } catch (const std::exception& e) {
      AGENTPAY_LOG_ERROR("event sink failed",
                         {observability::StringField("kind", agentpay::settlement::v1::SettlementEventKind_Name(event.kind())),
                          observability::StringField("payment_id", event.payment_id()), observability::StringField("error", e.what())});
    }
  }
}

std::size_t EventBus::SinkCount() const {
  std::scoped_lock lock(mutex_);
  return sinks_.size();
}

} // namespace agentpay::events
