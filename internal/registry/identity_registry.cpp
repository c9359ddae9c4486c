#include "internal/registry/identity_registry.hpp"

#include <mutex>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace agentpay::registry {

namespace {

std::string RequireOwner(const std::string& owner) {
  auto normalized = util::NormalizeAddress(owner);
  if (util::IsZeroAddress(normalized)) {
    throw util::InvalidArgument("agent owner must not be the zero address");
  }
  return normalized;
}

} // namespace

void IdentityRegistry::Register(uint64_t agent_id, const std::string& owner) {
  auto normalized = RequireOwner(owner);

  std::unique_lock lock(mutex_);
  if (!owners_.emplace(agent_id, std::move(normalized)).second) {
    throw util::AlreadyExists("agent already registered: " + std::to_string(agent_id));
  }
}

std::string IdentityRegistry::Transfer(uint64_t agent_id, const std::string& new_owner) {
  auto normalized = RequireOwner(new_owner);

  std::unique_lock lock(mutex_);
  auto             it = owners_.find(agent_id);
  if (it == owners_.end()) {
    throw util::NotFound("unknown agent: " + std::to_string(agent_id));
  }
  return std::exchange(it->second, std::move(normalized));
}

std::string IdentityRegistry::OwnerOf(uint64_t agent_id) const {
  std::shared_lock lock(mutex_);
  auto             it = owners_.find(agent_id);
  if (it == owners_.end()) {
    throw util::NotFound("unknown agent: " + std::to_string(agent_id));
  }
  return it->second;
}

std::size_t IdentityRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return owners_.size();
}

} // namespace agentpay::registry
