#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/registry/ownership_registry.hpp"

namespace agentpay::registry {

/*
  In-process agent identity registry: one owner address per agent id.
*/
class IdentityRegistry final : public OwnershipRegistry {
 public:
  // Throws AlreadyExists for a known agent, InvalidArgument for a null owner.
  void Register(uint64_t agent_id, const std::string& owner);

  // Returns the previous owner.
  std::string Transfer(uint64_t agent_id, const std::string& new_owner);

  std::string OwnerOf(uint64_t agent_id) const override;

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                  mutex_;
  std::unordered_map<uint64_t, std::string> owners_;
};

} // namespace agentpay::registry
