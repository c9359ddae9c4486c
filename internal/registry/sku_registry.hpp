#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "internal/registry/sku_catalog.hpp"

namespace agentpay::registry {

/*
  In-process SKU registry.

  A SKU is immutable once created except for its active flag. Pricing token
  addresses are stored normalized (lowercase).
*/
class SkuRegistry final : public SkuCatalog {
 public:
  // Validates and stores a copy; returns the stored form.
  agentpay::settlement::v1::Sku CreateSku(const agentpay::settlement::v1::Sku& sku);

  agentpay::settlement::v1::Sku SetActive(uint64_t sku_id, bool active);

  // Throws NotFound for an unknown sku.
  agentpay::settlement::v1::Sku GetSku(uint64_t sku_id) const;

  std::optional<agentpay::settlement::v1::Sku> FindSku(uint64_t sku_id) const override;

 private:
  mutable std::shared_mutex                                   mutex_;
  std::unordered_map<uint64_t, agentpay::settlement::v1::Sku> skus_;
};

} // namespace agentpay::registry
