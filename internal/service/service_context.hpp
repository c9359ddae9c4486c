#pragma once

#include <memory>

namespace agentpay::core { class SettlementEngine; }
namespace agentpay::registry { class IdentityRegistry; class SkuRegistry; }
namespace agentpay::token { class LocalToken; }
namespace agentpay::auth { class AccessPolicy; }

namespace agentpay::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<agentpay::core::SettlementEngine>   engine;
  std::shared_ptr<agentpay::registry::IdentityRegistry> identities;
  std::shared_ptr<agentpay::registry::SkuRegistry>    skus;
  std::shared_ptr<agentpay::token::LocalToken>        token;
  std::shared_ptr<const agentpay::auth::AccessPolicy> access;
};

} // namespace agentpay::service
