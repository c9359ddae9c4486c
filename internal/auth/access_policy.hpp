#pragma once

#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agentpay::runtime::config {
class RuntimeConfig;
}

namespace agentpay::auth {

enum class Capability {
  kAdmin,
  kFacilitator,
};

const char* CapabilityName(Capability capability);

// Throws InvalidArgument for anything but "admin" / "facilitator".
Capability ParseCapability(std::string_view name);

/*
  Authenticated caller identity. The anonymous principal has no name,
  no address and no capabilities.
*/
struct Principal {
  std::string          name;
  std::string          address;
  std::set<Capability> capabilities;
  bool                 authenticated = false;

  bool Has(Capability capability) const {
    return capabilities.contains(capability);
  }

  static Principal Anonymous() {
    return {};
  }
};

/*
  Capability checks performed at every mutating entry point.
*/
class AccessPolicy {
 public:
  virtual ~AccessPolicy() = default;

  // Empty token -> anonymous principal; unknown token -> Unauthenticated.
  virtual Principal Authenticate(std::string_view bearer_token) const = 0;

  // Unauthenticated for the anonymous principal, PermissionDenied when the
  // capability is missing.
  virtual void Require(const Principal& principal, Capability capability, std::string_view operation) const = 0;
};

class StaticAccessPolicy final : public AccessPolicy {
 public:
  struct Entry {
    std::string token;
    Principal   principal;
  };

  explicit StaticAccessPolicy(std::vector<Entry> entries);

  static StaticAccessPolicy FromConfig(const agentpay::runtime::config::RuntimeConfig& config);

  Principal Authenticate(std::string_view bearer_token) const override;
  void      Require(const Principal& principal, Capability capability, std::string_view operation) const override;

 private:
  std::unordered_map<std::string, Principal> by_token_;
};

} // namespace agentpay::auth
