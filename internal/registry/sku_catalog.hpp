#pragma once

#include <cstdint>
#include <optional>

#include "agentpay/settlement/v1/types.pb.h"

namespace agentpay::registry {

class SkuCatalog {
 public:
  virtual ~SkuCatalog() = default;

  // std::nullopt for an unknown sku; the engine treats that as inactive.
  virtual std::optional<agentpay::settlement::v1::Sku> FindSku(uint64_t sku_id) const = 0;
};

} // namespace agentpay::registry
