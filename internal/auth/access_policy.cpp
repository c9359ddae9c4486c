#include "internal/auth/access_policy.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace agentpay::auth {

const char* CapabilityName(Capability capability) {
  switch (capability) {
    case Capability::kAdmin:
      return "admin";
    case Capability::kFacilitator:
      return "facilitator";
  }
  return "unknown";
}

Capability ParseCapability(std::string_view name) {
  if (name == "admin") return Capability::kAdmin;
  if (name == "facilitator") return Capability::kFacilitator;
  throw util::InvalidArgument("unknown capability '" + std::string(name) + "'");
}

StaticAccessPolicy::StaticAccessPolicy(std::vector<Entry> entries) {
  for (auto& entry : entries) {
    if (entry.token.empty()) {
      throw util::InvalidArgument("principal '" + entry.principal.name + "' has an empty api token");
    }
    entry.principal.authenticated = true;
    if (!by_token_.emplace(entry.token, std::move(entry.principal)).second) {
      throw util::InvalidArgument("duplicate api token in principal configuration");
    }
  }
}

StaticAccessPolicy StaticAccessPolicy::FromConfig(const agentpay::runtime::config::RuntimeConfig& config) {
  std::vector<Entry> entries;
  entries.reserve(config.principals_size());

  for (const auto& principal_config : config.principals()) {
    Entry entry;
    entry.token          = principal_config.api_token();
    entry.principal.name = principal_config.name();
    if (!principal_config.address().empty()) {
      entry.principal.address = util::NormalizeAddress(principal_config.address());
    }
    for (const auto& capability : principal_config.capabilities()) {
      entry.principal.capabilities.insert(ParseCapability(capability));
    }
    entries.push_back(std::move(entry));
  }

  return StaticAccessPolicy(std::move(entries));
}

Principal StaticAccessPolicy::Authenticate(std::string_view bearer_token) const {
  if (bearer_token.empty()) {
    return Principal::Anonymous();
  }

  auto it = by_token_.find(std::string(bearer_token));
  if (it == by_token_.end()) {
    throw util::Unauthenticated("unknown api token");
  }
  return it->second;
}

void StaticAccessPolicy::Require(const Principal& principal, Capability capability, std::string_view operation) const {
  if (!principal.authenticated) {
    throw util::Unauthenticated(std::string(operation) + " requires an authenticated caller");
  }
  if (!principal.Has(capability)) {
    throw util::PermissionDenied(std::string(operation) + " requires the " + CapabilityName(capability) + " capability; '" +
                                 principal.name + "' does not hold it");
  }
}

} // namespace agentpay::auth
