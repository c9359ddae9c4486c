#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/auth/access_policy.hpp"
#include "internal/core/fee_split.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/events/log_event_sink.hpp"
#include "internal/events/stored_event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hex.hpp"
#if AGENTPAY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if AGENTPAY_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace agentpay::factory {

namespace {

using agentpay::runtime::config::RuntimeConfig;
using agentpay::settlement::v1::LicenseType;

#if AGENTPAY_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  sqlite_db->ApplySchema(db::sql::SqliteSchema(), db::sql::kLedgerSchemaVersion);

  sqlite_db->Exec("SELECT payment_id,payer,agent_id,sku_id,amount,consumed_at FROM consumed_payments LIMIT 1;");
  sqlite_db->Exec("SELECT agent_id,payer,call_credits,valid_until FROM entitlements LIMIT 1;");
  sqlite_db->Exec("SELECT beneficiary,balance FROM revenue_balances LIMIT 1;");
  sqlite_db->Exec("SELECT fee_basis_points,treasury FROM fee_config LIMIT 1;");
  sqlite_db->Exec("SELECT sequence,kind,occurred_at FROM settlement_events LIMIT 1;");
}
#endif

#if AGENTPAY_DB_POSTGRES
constexpr uint32_t kDefaultPgConnections = 16;

void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT payment_id,payer,agent_id,sku_id,amount,consumed_at FROM consumed_payments LIMIT 1;");
  tx.exec("SELECT agent_id,payer,call_credits,valid_until FROM entitlements LIMIT 1;");
  tx.exec("SELECT beneficiary,balance FROM revenue_balances LIMIT 1;");
  tx.exec("SELECT fee_basis_points,treasury FROM fee_config LIMIT 1;");
  tx.exec("SELECT sequence,kind,occurred_at FROM settlement_events LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if AGENTPAY_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw util::InvalidArgument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    AGENTPAY_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"),
                                           observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if AGENTPAY_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() == 0 ? kDefaultPgConnections : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    AGENTPAY_LOG_INFO("repository ready", {observability::StringField("backend", "postgres"),
                                           observability::UintField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  AGENTPAY_LOG_WARN("repository ready", {observability::StringField("backend", "memory"),
                                         observability::StringField("note", "ledger state is lost on restart")});
  return std::make_shared<db::memory::MemoryRepository>();
}

LicenseType ParseLicenseType(const std::string& name) {
  if (name == "per_call") {
    return agentpay::settlement::v1::LICENSE_TYPE_PER_CALL;
  }
  if (name == "per_period") {
    return agentpay::settlement::v1::LICENSE_TYPE_PER_PERIOD;
  }
  throw util::InvalidArgument("unknown license_type '" + name + "': expected per_call or per_period");
}

core::EngineConfig BuildEngineConfig(const RuntimeConfig& config) {
  const auto& settlement = config.settlement();
  if (settlement.settlement_address().empty()) {
    throw util::InvalidArgument("settlement.settlement_address is required");
  }
  if (util::IsZeroAddress(settlement.settlement_address())) {
    throw util::InvalidArgument("settlement.settlement_address must not be the zero address");
  }
  if (settlement.token_address().empty()) {
    throw util::InvalidArgument("settlement.token_address is required");
  }
  if (settlement.fee_basis_points() > core::kMaxFeeBasisPoints) {
    throw util::FeeTooHighError("settlement.fee_basis_points " + std::to_string(settlement.fee_basis_points()) + " exceeds " +
                                std::to_string(core::kMaxFeeBasisPoints));
  }
  if (settlement.fee_basis_points() > 0 && settlement.treasury_address().empty()) {
    throw util::InvalidArgument("settlement.treasury_address is required when a fee is configured");
  }

  core::EngineConfig engine_config;
  engine_config.settlement_address       = settlement.settlement_address();
  engine_config.token_address            = settlement.token_address();
  engine_config.initial_fee_basis_points = settlement.fee_basis_points();
  engine_config.initial_treasury         = settlement.treasury_address().empty() ? util::ZeroAddress() : settlement.treasury_address();
  return engine_config;
}

std::shared_ptr<token::LocalToken> BuildToken(const RuntimeConfig& config, std::shared_ptr<const util::Clock> clock) {
  token::Domain domain;
  domain.name               = config.token().name();
  domain.version            = config.token().version();
  domain.chain_id           = config.token().chain_id();
  domain.verifying_contract = config.settlement().token_address();

  auto token = std::make_shared<token::LocalToken>(std::move(domain), std::move(clock));
  for (const auto& account : config.token().accounts()) {
    if (account.balance() > 0) {
      token->Mint(account.address(), account.balance());
    }
    if (!account.signing_key().empty()) {
      token->SetSigningKey(account.address(), util::HexDecode(account.signing_key()));
    }
  }

  AGENTPAY_LOG_INFO("token ready", {observability::StringField("address", token->Address()),
                                    observability::UintField("accounts", static_cast<uint64_t>(config.token().accounts_size())),
                                    observability::UintField("total_supply", token->TotalSupply())});
  return token;
}

void SeedRegistries(const RuntimeConfig& config, registry::IdentityRegistry& identities, registry::SkuRegistry& skus) {
  for (const auto& agent : config.agents()) {
    identities.Register(agent.agent_id(), agent.owner());
  }

  for (const auto& sku_config : config.skus()) {
    agentpay::settlement::v1::Sku sku;
    sku.set_sku_id(sku_config.sku_id());
    sku.set_agent_id(sku_config.agent_id());
    sku.set_license_type(ParseLicenseType(sku_config.license_type()));
    sku.set_pricing_token(sku_config.pricing_token().empty() ? config.settlement().token_address() : sku_config.pricing_token());
    sku.set_price(sku_config.price());
    sku.set_period_seconds(sku_config.period_seconds());
    sku.set_active(sku_config.active());
    skus.CreateSku(sku);
  }
}

} // namespace

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const RuntimeConfig& config, std::shared_ptr<const util::Clock> clock) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Persistence and collaborators
  // ------------------------------------------------------------------
  auto engine_config = BuildEngineConfig(config);

  deps.clock      = clock ? std::move(clock) : std::make_shared<util::WallClock>();
  deps.repository = BuildRepository(config);
  deps.identities = std::make_shared<registry::IdentityRegistry>();
  deps.skus       = std::make_shared<registry::SkuRegistry>();
  deps.token      = BuildToken(config, deps.clock);
  deps.access     = std::make_shared<auth::StaticAccessPolicy>(auth::StaticAccessPolicy::FromConfig(config));

  SeedRegistries(config, *deps.identities, *deps.skus);

  // ------------------------------------------------------------------
  // Events
  // ------------------------------------------------------------------
  deps.events = std::make_shared<events::EventBus>();
  deps.events->Subscribe(std::make_shared<events::StoredEventSink>(deps.repository));
  deps.events->Subscribe(std::make_shared<events::LogEventSink>());

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  deps.engine = std::make_shared<core::SettlementEngine>(deps.repository, deps.identities, deps.skus, deps.token, deps.access, deps.events,
                                                         deps.clock, std::move(engine_config));
  deps.engine->Bootstrap();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine     = deps.engine;
  ctx.identities = deps.identities;
  ctx.skus       = deps.skus;
  ctx.token      = deps.token;
  ctx.access     = deps.access;

  deps.settlement_service = std::make_shared<service::SettlementService>(ctx);
  deps.revenue_service    = std::make_shared<service::RevenueService>(ctx);
  deps.admin_service      = std::make_shared<service::AdminService>(ctx);
  deps.registry_service   = std::make_shared<service::RegistryService>(ctx);

  AGENTPAY_LOG_INFO("runtime built", {observability::StringField("settlement_address", deps.engine->config().settlement_address),
                                      observability::UintField("agents", deps.identities->Size()),
                                      observability::UintField("principals", static_cast<uint64_t>(config.principals_size()))});
  return deps;
}

} // namespace agentpay::factory
