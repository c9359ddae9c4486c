#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "agentpay/settlement/v1/admin_service.grpc.pb.h"
#include "agentpay/settlement/v1/registry_service.grpc.pb.h"
#include "agentpay/settlement/v1/revenue_service.grpc.pb.h"
#include "agentpay/settlement/v1/settlement_service.grpc.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/token/authorization_digest.hpp"
#include "internal/util/hex.hpp"

using namespace agentpay::settlement::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  agentpayctl sign <config.yaml> <from> <value> <valid_after> <valid_before> <nonce>\n"
            << "  agentpayctl <addr> settle <payment_id> <sku_id> <agent_id> <payer> <amount> <valid_after> <valid_before> <nonce> <signature>\n"
            << "  agentpayctl <addr> has-access <agent_id> <payer>\n"
            << "  agentpayctl <addr> entitlement <agent_id> <payer>\n"
            << "  agentpayctl <addr> consume <agent_id> <payer>\n"
            << "  agentpayctl <addr> withdraw <to> <amount>\n"
            << "  agentpayctl <addr> balance <beneficiary>\n"
            << "  agentpayctl <addr> set-fee <basis_points>\n"
            << "  agentpayctl <addr> set-treasury <address>\n"
            << "  agentpayctl <addr> fee-config\n"
            << "  agentpayctl <addr> stats\n"
            << "  agentpayctl <addr> events [after_sequence] [max_events]\n"
            << "  agentpayctl <addr> register-agent <agent_id> <owner>\n"
            << "  agentpayctl <addr> transfer-agent <agent_id> <new_owner>\n"
            << "  agentpayctl <addr> owner <agent_id>\n"
            << "  agentpayctl <addr> create-sku <sku_id> <agent_id> <per_call|per_period> <pricing_token> <price> [period_seconds]\n"
            << "  agentpayctl <addr> sku-active <sku_id> <true|false>\n"
            << "  agentpayctl <addr> sku <sku_id>\n"
            << "  agentpayctl <addr> fund <address> <amount>\n"
            << "  agentpayctl <addr> token-balance <address>\n"
            << "\n"
            << "Mutating commands send AGENTPAY_TOKEN as a bearer token.\n";
}

static std::optional<LicenseType> ParseLicenseType(const std::string& value) {
  if (value == "per_call") {
    return LICENSE_TYPE_PER_CALL;
  }
  if (value == "per_period") {
    return LICENSE_TYPE_PER_PERIOD;
  }
  return std::nullopt;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message();
  if (!status.error_details().empty()) {
    std::cerr << " [" << status.error_details() << "]";
  }
  std::cerr << "\n";
  return 2;
}

static void PrintEntitlement(const Entitlement& entitlement) {
  std::cout << "agent_id=" << entitlement.agent_id() << "\n";
  std::cout << "payer=" << entitlement.payer() << "\n";
  std::cout << "call_credits=" << entitlement.call_credits() << "\n";
  std::cout << "valid_until=" << entitlement.valid_until() << "\n";
}

static void PrintFeeConfig(const FeeConfig& fee_config) {
  std::cout << "fee_basis_points=" << fee_config.fee_basis_points() << "\n";
  std::cout << "treasury=" << fee_config.treasury() << "\n";
}

static void PrintSku(const Sku& sku) {
  std::cout << "sku_id=" << sku.sku_id() << "\n";
  std::cout << "agent_id=" << sku.agent_id() << "\n";
  std::cout << "license_type=" << LicenseType_Name(sku.license_type()) << "\n";
  std::cout << "pricing_token=" << sku.pricing_token() << "\n";
  std::cout << "price=" << sku.price() << "\n";
  std::cout << "period_seconds=" << sku.period_seconds() << "\n";
  std::cout << "active=" << (sku.active() ? "true" : "false") << "\n";
}

// Offline: signs a transfer authorization from `from` to the configured
// settlement address with the key from the config's token accounts.
static int Sign(int argc, char** argv) {
  if (argc < 8) {
    Usage();
    return 1;
  }

  const auto config = agentpay::config::ConfigLoader::LoadFromYaml(argv[2]);
  const auto from   = agentpay::util::NormalizeAddress(argv[3]);

  std::string signing_key;
  for (const auto& account : config.token().accounts()) {
    if (!account.address().empty() && agentpay::util::NormalizeAddress(account.address()) == from) {
      signing_key = agentpay::util::HexDecode(account.signing_key());
    }
  }
  if (signing_key.empty()) {
    std::cerr << "no signing key configured for " << from << "\n";
    return 1;
  }

  agentpay::token::Domain domain;
  domain.name               = config.token().name();
  domain.version            = config.token().version();
  domain.chain_id           = config.token().chain_id();
  domain.verifying_contract = agentpay::util::NormalizeAddress(config.settlement().token_address());

  agentpay::token::TransferAuthorization authorization;
  authorization.from         = from;
  authorization.to           = agentpay::util::NormalizeAddress(config.settlement().settlement_address());
  authorization.value        = std::stoull(argv[4]);
  authorization.valid_after  = std::stoull(argv[5]);
  authorization.valid_before = std::stoull(argv[6]);
  authorization.nonce        = agentpay::util::NormalizeBytes32(argv[7], "nonce");

  std::cout << "0x" << agentpay::util::HexEncode(agentpay::token::SignAuthorization(domain, authorization, signing_key)) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc >= 2 && std::string(argv[1]) == "sign") {
    try {
      return Sign(argc, argv);
    } catch (const std::exception& e) {
      std::cerr << e.what() << "\n";
      return 1;
    }
  }

  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto settlement_stub = SettlementService::NewStub(channel);
  auto revenue_stub    = RevenueService::NewStub(channel);
  auto admin_stub      = AdminService::NewStub(channel);
  auto registry_stub   = RegistryService::NewStub(channel);

  grpc::ClientContext ctx;
  if (const char* token = std::getenv("AGENTPAY_TOKEN"); token != nullptr && *token != '\0') {
    ctx.AddMetadata("authorization", std::string("Bearer ") + token);
  }

  try {
    // ------------------------------------------------------------

    if (cmd == "settle") {
      if (argc < 12) return 1;

      SettleRequest req;
      auto*         receipt = req.mutable_receipt();
      receipt->set_payment_id(argv[3]);
      receipt->set_sku_id(std::stoull(argv[4]));
      receipt->set_agent_id(std::stoull(argv[5]));
      receipt->set_payer(argv[6]);
      receipt->set_amount(std::stoull(argv[7]));

      auto* proof = req.mutable_authorization();
      proof->set_valid_after(std::stoull(argv[8]));
      proof->set_valid_before(std::stoull(argv[9]));
      proof->set_nonce(argv[10]);
      proof->set_signature(agentpay::util::HexDecode(argv[11]));

      SettleResponse resp;
      auto           status = settlement_stub->Settle(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "payment_id=" << resp.payment_id() << "\n";
      std::cout << "beneficiary=" << resp.beneficiary() << "\n";
      std::cout << "net=" << resp.net() << "\n";
      std::cout << "fee=" << resp.fee() << "\n";
      PrintEntitlement(resp.entitlement());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "has-access") {
      if (argc < 5) return 1;

      HasAccessRequest req;
      req.set_agent_id(std::stoull(argv[3]));
      req.set_payer(argv[4]);

      HasAccessResponse resp;
      auto              status = settlement_stub->HasAccess(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << (resp.has_access() ? "true" : "false") << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "entitlement") {
      if (argc < 5) return 1;

      GetEntitlementRequest req;
      req.set_agent_id(std::stoull(argv[3]));
      req.set_payer(argv[4]);

      GetEntitlementResponse resp;
      auto                   status = settlement_stub->GetEntitlement(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintEntitlement(resp.entitlement());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "consume") {
      if (argc < 5) return 1;

      ConsumeCallRequest req;
      req.set_agent_id(std::stoull(argv[3]));
      req.set_payer(argv[4]);

      ConsumeCallResponse resp;
      auto                status = settlement_stub->ConsumeCall(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintEntitlement(resp.entitlement());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "withdraw") {
      if (argc < 5) return 1;

      WithdrawRequest req;
      req.set_to(argv[3]);
      req.set_amount(std::stoull(argv[4]));

      WithdrawResponse resp;
      auto             status = revenue_stub->Withdraw(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "remaining_balance=" << resp.remaining_balance() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "balance") {
      if (argc < 4) return 1;

      GetBalanceRequest req;
      req.set_beneficiary(argv[3]);

      GetBalanceResponse resp;
      auto               status = revenue_stub->GetBalance(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "balance=" << resp.balance() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "set-fee") {
      if (argc < 4) return 1;

      SetFeeBasisPointsRequest req;
      req.set_fee_basis_points(static_cast<uint32_t>(std::stoul(argv[3])));

      FeeConfigResponse resp;
      auto              status = admin_stub->SetFeeBasisPoints(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintFeeConfig(resp.fee_config());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "set-treasury") {
      if (argc < 4) return 1;

      SetTreasuryRequest req;
      req.set_treasury(argv[3]);

      FeeConfigResponse resp;
      auto              status = admin_stub->SetTreasury(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintFeeConfig(resp.fee_config());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "fee-config") {
      GetFeeConfigRequest req;
      FeeConfigResponse   resp;
      auto                status = admin_stub->GetFeeConfig(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintFeeConfig(resp.fee_config());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      StatsRequest  req;
      StatsResponse resp;

      auto status = admin_stub->Stats(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "consumed_payments=" << resp.consumed_payments() << "\n";
      std::cout << "entitlement_records=" << resp.entitlement_records() << "\n";
      std::cout << "beneficiaries=" << resp.beneficiaries() << "\n";
      std::cout << "outstanding_revenue=" << resp.outstanding_revenue() << "\n";
      std::cout << "last_event_sequence=" << resp.last_event_sequence() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "events") {
      ListEventsRequest req;
      req.set_after_sequence(argc >= 4 ? std::stoull(argv[3]) : 0);
      req.set_max_events(argc >= 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 0);

      ListEventsResponse resp;
      auto               status = admin_stub->ListEvents(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& event : resp.events()) {
        std::cout << event.sequence() << " " << SettlementEventKind_Name(event.kind()) << " at=" << event.occurred_at();
        if (!event.payment_id().empty()) std::cout << " payment_id=" << event.payment_id();
        if (event.agent_id() != 0) std::cout << " agent_id=" << event.agent_id();
        if (!event.payer().empty()) std::cout << " payer=" << event.payer();
        if (!event.beneficiary().empty()) std::cout << " beneficiary=" << event.beneficiary();
        if (event.amount() != 0) std::cout << " amount=" << event.amount();
        if (event.fee() != 0) std::cout << " fee=" << event.fee();
        if (event.net() != 0) std::cout << " net=" << event.net();
        std::cout << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "register-agent" || cmd == "transfer-agent") {
      if (argc < 5) return 1;

      AgentOwnerResponse resp;
      grpc::Status       status;
      if (cmd == "register-agent") {
        RegisterAgentRequest req;
        req.set_agent_id(std::stoull(argv[3]));
        req.set_owner(argv[4]);
        status = registry_stub->RegisterAgent(&ctx, req, &resp);
      } else {
        TransferAgentRequest req;
        req.set_agent_id(std::stoull(argv[3]));
        req.set_new_owner(argv[4]);
        status = registry_stub->TransferAgent(&ctx, req, &resp);
      }
      if (!status.ok()) return Fail(status);

      std::cout << "agent_id=" << resp.agent_id() << "\n";
      std::cout << "owner=" << resp.owner() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "owner") {
      if (argc < 4) return 1;

      GetOwnerRequest req;
      req.set_agent_id(std::stoull(argv[3]));

      AgentOwnerResponse resp;
      auto               status = registry_stub->GetOwner(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "owner=" << resp.owner() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "create-sku") {
      if (argc < 8) return 1;

      auto license_type = ParseLicenseType(argv[5]);
      if (!license_type.has_value()) {
        std::cerr << "unsupported license type: " << argv[5] << "\n";
        return 1;
      }

      CreateSkuRequest req;
      auto*            sku = req.mutable_sku();
      sku->set_sku_id(std::stoull(argv[3]));
      sku->set_agent_id(std::stoull(argv[4]));
      sku->set_license_type(license_type.value());
      sku->set_pricing_token(argv[6]);
      sku->set_price(std::stoull(argv[7]));
      sku->set_period_seconds(argc >= 9 ? std::stoull(argv[8]) : 0);
      sku->set_active(true);

      SkuResponse resp;
      auto        status = registry_stub->CreateSku(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintSku(resp.sku());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "sku-active") {
      if (argc < 5) return 1;

      SetSkuActiveRequest req;
      req.set_sku_id(std::stoull(argv[3]));
      req.set_active(std::string(argv[4]) == "true");

      SkuResponse resp;
      auto        status = registry_stub->SetSkuActive(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintSku(resp.sku());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "sku") {
      if (argc < 4) return 1;

      GetSkuRequest req;
      req.set_sku_id(std::stoull(argv[3]));

      SkuResponse resp;
      auto        status = registry_stub->GetSku(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintSku(resp.sku());
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "fund" || cmd == "token-balance") {
      if (argc < (cmd == "fund" ? 5 : 4)) return 1;

      TokenBalanceResponse resp;
      grpc::Status         status;
      if (cmd == "fund") {
        FundAccountRequest req;
        req.set_address(argv[3]);
        req.set_amount(std::stoull(argv[4]));
        status = registry_stub->FundAccount(&ctx, req, &resp);
      } else {
        GetTokenBalanceRequest req;
        req.set_address(argv[3]);
        status = registry_stub->GetTokenBalance(&ctx, req, &resp);
      }
      if (!status.ok()) return Fail(status);

      std::cout << "address=" << resp.address() << "\n";
      std::cout << "balance=" << resp.balance() << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    // std::stoull and HexDecode reject malformed arguments
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
