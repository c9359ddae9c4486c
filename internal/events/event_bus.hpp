#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "internal/events/event_sink.hpp"

namespace agentpay::events {

/*
  Fan-out to every subscribed sink in subscription order.

  A failing sink is logged and skipped; the ledger change behind the event
  is already durable and other sinks still receive it.
*/
class EventBus final : public EventSink {
 public:
  void Subscribe(std::shared_ptr<EventSink> sink);

  void Publish(const agentpay::settlement::v1::SettlementEvent& event) override;

  std::size_t SinkCount() const;

 private:
  mutable std::mutex                      mutex_;
  std::vector<std::shared_ptr<EventSink>> sinks_;
};

} // namespace agentpay::events
