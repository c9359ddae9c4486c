#pragma once

#include <cstdint>
#include <string>

namespace agentpay::registry {

/*
  Identity ownership lookup consumed by the settlement engine.

  OwnerOf is evaluated on every settlement and must not be cached by the
  caller; ownership transfers redirect only later revenue.
*/
class OwnershipRegistry {
 public:
  virtual ~OwnershipRegistry() = default;

  // Throws NotFound for an unknown agent.
  virtual std::string OwnerOf(uint64_t agent_id) const = 0;
};

} // namespace agentpay::registry
