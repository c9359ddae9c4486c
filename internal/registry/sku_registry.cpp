#include "internal/registry/sku_registry.hpp"

#include <mutex>

#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace agentpay::registry {

using agentpay::settlement::v1::LICENSE_TYPE_PER_CALL;
using agentpay::settlement::v1::LICENSE_TYPE_PER_PERIOD;
using agentpay::settlement::v1::Sku;

namespace {

Sku Validate(const Sku& sku) {
  if (sku.sku_id() == 0) {
    throw util::InvalidArgument("sku_id is required");
  }
  if (sku.license_type() != LICENSE_TYPE_PER_CALL && sku.license_type() != LICENSE_TYPE_PER_PERIOD) {
    throw util::InvalidArgument("sku " + std::to_string(sku.sku_id()) + ": license_type must be PER_CALL or PER_PERIOD");
  }
  if (sku.price() == 0) {
    throw util::InvalidArgument("sku " + std::to_string(sku.sku_id()) + ": price must be positive");
  }
  if (sku.license_type() == LICENSE_TYPE_PER_PERIOD && sku.period_seconds() == 0) {
    throw util::InvalidArgument("sku " + std::to_string(sku.sku_id()) + ": period_seconds must be positive for PER_PERIOD");
  }

  Sku stored = sku;
  stored.set_pricing_token(util::NormalizeAddress(sku.pricing_token()));
  if (stored.license_type() == LICENSE_TYPE_PER_CALL) {
    stored.set_period_seconds(0);
  }
  return stored;
}

} // namespace

Sku SkuRegistry::CreateSku(const Sku& sku) {
  auto stored = Validate(sku);

  std::unique_lock lock(mutex_);
  if (skus_.contains(stored.sku_id())) {
    throw util::AlreadyExists("sku already exists: " + std::to_string(stored.sku_id()));
  }
  skus_[stored.sku_id()] = stored;
  return stored;
}

Sku SkuRegistry::SetActive(uint64_t sku_id, bool active) {
  std::unique_lock lock(mutex_);
  auto             it = skus_.find(sku_id);
  if (it == skus_.end()) {
    throw util::NotFound("unknown sku: " + std::to_string(sku_id));
  }
  it->second.set_active(active);
  return it->second;
}

Sku SkuRegistry::GetSku(uint64_t sku_id) const {
  auto sku = FindSku(sku_id);
  if (!sku) {
    throw util::NotFound("unknown sku: " + std::to_string(sku_id));
  }
  return *sku;
}

std::optional<Sku> SkuRegistry::FindSku(uint64_t sku_id) const {
  std::shared_lock lock(mutex_);
  auto             it = skus_.find(sku_id);
  if (it == skus_.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace agentpay::registry
