#pragma once

#include "agentpay/settlement/v1/registry_service.pb.h"
#include "internal/auth/access_policy.hpp"
#include "service_context.hpp"

namespace agentpay::service {

/*
  Administration of the in-process collaborators: agent identities, SKUs
  and the local token.
*/
class RegistryService {
 public:
  explicit RegistryService(ServiceContext ctx);

  agentpay::settlement::v1::AgentOwnerResponse RegisterAgent(const auth::Principal& caller,
                                                             const agentpay::settlement::v1::RegisterAgentRequest& req);

  // Allowed for admins and for the agent's current owner.
  agentpay::settlement::v1::AgentOwnerResponse TransferAgent(const auth::Principal& caller,
                                                             const agentpay::settlement::v1::TransferAgentRequest& req);

  agentpay::settlement::v1::AgentOwnerResponse GetOwner(const agentpay::settlement::v1::GetOwnerRequest& req);

  agentpay::settlement::v1::SkuResponse CreateSku(const auth::Principal& caller, const agentpay::settlement::v1::CreateSkuRequest& req);

  agentpay::settlement::v1::SkuResponse SetSkuActive(const auth::Principal& caller, const agentpay::settlement::v1::SetSkuActiveRequest& req);

  agentpay::settlement::v1::SkuResponse GetSku(const agentpay::settlement::v1::GetSkuRequest& req);

  agentpay::settlement::v1::TokenBalanceResponse FundAccount(const auth::Principal& caller,
                                                             const agentpay::settlement::v1::FundAccountRequest& req);

  agentpay::settlement::v1::TokenBalanceResponse GetTokenBalance(const agentpay::settlement::v1::GetTokenBalanceRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace agentpay::service
