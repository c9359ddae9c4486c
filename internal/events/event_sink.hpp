#pragma once

#include "agentpay/settlement/v1/types.pb.h"

namespace agentpay::events {

/*
  Receiver of settlement events. Events are published only after the
  ledger transaction that produced them has committed.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const agentpay::settlement::v1::SettlementEvent& event) = 0;
};

} // namespace agentpay::events
