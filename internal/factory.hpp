#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/settlement_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/registry/identity_registry.hpp"
#include "internal/registry/sku_registry.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/revenue_service.hpp"
#include "internal/service/settlement_service.hpp"
#include "internal/token/local_token.hpp"
#include "internal/util/time.hpp"

namespace agentpay::factory {

/*
  RuntimeDependencies

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<const util::Clock>         clock;
  std::shared_ptr<registry::IdentityRegistry> identities;
  std::shared_ptr<registry::SkuRegistry>     skus;
  std::shared_ptr<token::LocalToken>         token;
  std::shared_ptr<const auth::AccessPolicy>  access;
  std::shared_ptr<events::EventBus>          events;
  std::shared_ptr<core::SettlementEngine>    engine;

  std::shared_ptr<service::SettlementService> settlement_service;
  std::shared_ptr<service::RevenueService>    revenue_service;
  std::shared_ptr<service::AdminService>      admin_service;
  std::shared_ptr<service::RegistryService>   registry_service;
};

/*
  BuildRuntime

  Constructs the entire backend based on runtime config. A null clock
  means wall-clock time.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const agentpay::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<const util::Clock>              clock = nullptr);

} // namespace agentpay::factory
