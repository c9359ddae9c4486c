#include "registry_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/registry/identity_registry.hpp"
#include "internal/registry/sku_registry.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/token/local_token.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"

namespace agentpay::service {

using namespace agentpay::settlement::v1;

namespace {

AgentOwnerResponse OwnerResponse(uint64_t agent_id, const std::string& owner) {
  AgentOwnerResponse resp;
  resp.set_agent_id(agent_id);
  resp.set_owner(owner);
  return resp;
}

SkuResponse ToResponse(const Sku& sku) {
  SkuResponse resp;
  *resp.mutable_sku() = sku;
  return resp;
}

} // namespace

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AgentOwnerResponse RegistryService::RegisterAgent(const auth::Principal& caller, const RegisterAgentRequest& req) {
  return ObserveRpc("RegistryService.RegisterAgent", caller.name, [&] {
    ctx_.access->Require(caller, auth::Capability::kAdmin, "register_agent");
    ctx_.identities->Register(req.agent_id(), req.owner());
    const auto owner = ctx_.identities->OwnerOf(req.agent_id());
    AGENTPAY_LOG_INFO("agent registered",
                      {observability::UintField("agent_id", req.agent_id()), observability::StringField("owner", owner)});
    return OwnerResponse(req.agent_id(), owner);
  });
}

AgentOwnerResponse RegistryService::TransferAgent(const auth::Principal& caller, const TransferAgentRequest& req) {
  return ObserveRpc("RegistryService.TransferAgent", caller.name, [&] {
    if (!caller.authenticated) {
      throw util::Unauthenticated("transfer_agent requires an authenticated caller");
    }
    const auto current = ctx_.identities->OwnerOf(req.agent_id());
    if (!caller.Has(auth::Capability::kAdmin) && caller.address != current) {
      throw util::PermissionDenied("only an admin or the current owner may transfer agent " + std::to_string(req.agent_id()));
    }

    const auto previous = ctx_.identities->Transfer(req.agent_id(), req.new_owner());
    const auto owner    = ctx_.identities->OwnerOf(req.agent_id());
    AGENTPAY_LOG_INFO("agent transferred", {observability::UintField("agent_id", req.agent_id()),
                                            observability::StringField("from", previous), observability::StringField("to", owner)});
    return OwnerResponse(req.agent_id(), owner);
  });
}

AgentOwnerResponse RegistryService::GetOwner(const GetOwnerRequest& req) {
  return ObserveRpc("RegistryService.GetOwner", "", [&] { return OwnerResponse(req.agent_id(), ctx_.identities->OwnerOf(req.agent_id())); });
}

SkuResponse RegistryService::CreateSku(const auth::Principal& caller, const CreateSkuRequest& req) {
  return ObserveRpc("RegistryService.CreateSku", caller.name, [&] {
    ctx_.access->Require(caller, auth::Capability::kAdmin, "create_sku");
    if (!req.has_sku()) {
      throw util::InvalidArgument("sku is required");
    }
    const auto stored = ctx_.skus->CreateSku(req.sku());
    AGENTPAY_LOG_INFO("sku created", {observability::UintField("sku_id", stored.sku_id()), observability::UintField("agent_id", stored.agent_id()),
                                      observability::StringField("license_type", LicenseType_Name(stored.license_type())),
                                      observability::UintField("price", stored.price())});
    return ToResponse(stored);
  });
}

SkuResponse RegistryService::SetSkuActive(const auth::Principal& caller, const SetSkuActiveRequest& req) {
  return ObserveRpc("RegistryService.SetSkuActive", caller.name, [&] {
    ctx_.access->Require(caller, auth::Capability::kAdmin, "set_sku_active");
    const auto stored = ctx_.skus->SetActive(req.sku_id(), req.active());
    AGENTPAY_LOG_INFO("sku activation changed",
                      {observability::UintField("sku_id", req.sku_id()), observability::BoolField("active", req.active())});
    return ToResponse(stored);
  });
}

SkuResponse RegistryService::GetSku(const GetSkuRequest& req) {
  return ObserveRpc("RegistryService.GetSku", "", [&] { return ToResponse(ctx_.skus->GetSku(req.sku_id())); });
}

TokenBalanceResponse RegistryService::FundAccount(const auth::Principal& caller, const FundAccountRequest& req) {
  return ObserveRpc("RegistryService.FundAccount", caller.name, [&] {
    ctx_.access->Require(caller, auth::Capability::kAdmin, "fund_account");
    const auto address = util::NormalizeAddress(req.address());
    ctx_.token->Mint(address, req.amount());

    TokenBalanceResponse resp;
    resp.set_address(address);
    resp.set_balance(ctx_.token->BalanceOf(address));
    return resp;
  });
}

TokenBalanceResponse RegistryService::GetTokenBalance(const GetTokenBalanceRequest& req) {
  return ObserveRpc("RegistryService.GetTokenBalance", "", [&] {
    const auto address = util::NormalizeAddress(req.address());

    TokenBalanceResponse resp;
    resp.set_address(address);
    resp.set_balance(ctx_.token->BalanceOf(address));
    return resp;
  });
}

} // namespace agentpay::service
