#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/events/event_sink.hpp"

namespace agentpay::events {

/*
  Durable event log on top of the repository. Each Publish appends in its
  own transaction, so it must not be called while the publishing thread
  holds an open repository transaction.
*/
class StoredEventSink final : public EventSink {
 public:
  explicit StoredEventSink(std::shared_ptr<db::Repository> repository);

  void Publish(const agentpay::settlement::v1::SettlementEvent& event) override;

  static db::model::SettlementEventRecord         ToRecord(const agentpay::settlement::v1::SettlementEvent& event);
  static agentpay::settlement::v1::SettlementEvent ToProto(const db::model::SettlementEventRecord& record);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace agentpay::events
