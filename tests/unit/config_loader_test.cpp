#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using agentpay::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "agentpay_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\agentpay\\\"quoted\"\\ledger.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\agentpay\\\"quoted\"\\ledger.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
database:
  memory: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().has_memory());
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "0.0.0.0:50051"
leases:
  default_lease: "1s"
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestSettlementSectionKeepsFullPrecision() {
  auto config = ConfigLoader::LoadFromYamlString(R"(settlement:
  settlement_address: 0x5e77000000000000000000000000000000000001
  token_address: 0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48
  fee_basis_points: 250
  treasury_address: 0x7ea5000000000000000000000000000000000001
token:
  name: USD Coin
  version: 2
  chain_id: 8453
  accounts:
    - address: 0x9a7e000000000000000000000000000000000001
      balance: 18446744073709551615
      signing_key: 7061796572
skus:
  - sku_id: 1
    agent_id: 42
    license_type: per_call
    price: 9007199254740993
    active: true
)");

  // hex addresses stay strings, untouched by numeric parsing
  assert(config.settlement().settlement_address() == "0x5e77000000000000000000000000000000000001");
  assert(config.settlement().token_address() == "0xA0b86991c6218b36c1d19D4a2e9Eb0cE3606eB48");
  assert(config.settlement().fee_basis_points() == 250);

  // digit-only scalars land in string fields verbatim
  assert(config.token().version() == "2");
  assert(config.token().chain_id() == 8453);
  assert(config.token().accounts_size() == 1);
  assert(config.token().accounts(0).signing_key() == "7061796572");

  // neither value survives a round trip through a double
  assert(config.token().accounts(0).balance() == 18446744073709551615ULL);
  assert(config.skus(0).price() == 9007199254740993ULL);
  assert(config.skus(0).license_type() == "per_call");
  assert(config.skus(0).active());
}

void TestPrincipalsAndEmptyDocument() {
  auto config = ConfigLoader::LoadFromYamlString(R"(principals:
  - name: operator
    api_token: "0123"
    capabilities: [admin, facilitator]
logging:
  level: debug
)");
  assert(config.principals_size() == 1);
  assert(config.principals(0).api_token() == "0123");
  assert(config.principals(0).capabilities_size() == 2);
  assert(config.principals(0).capabilities(1) == "facilitator");
  assert(config.logging().level() == "debug");

  const auto empty = ConfigLoader::LoadFromYamlString("");
  assert(!empty.has_settlement());
  assert(empty.principals_size() == 0);
}

void TestMissingFileAndNegativeAmounts() {
  bool missing = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/agentpay/config.yaml");
  } catch (const std::runtime_error&) {
    missing = true;
  }
  assert(missing);

  bool negative = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(token:
  accounts:
    - address: 0x9a7e000000000000000000000000000000000001
      balance: -5
)");
  } catch (const std::runtime_error&) {
    negative = true;
  }
  assert(negative);
}

void TestEnvironmentExpansion() {
  setenv("AGENTPAY_TEST_ADMIN_TOKEN", "from-env", 1);
  setenv("AGENTPAY_TEST_FEE", "500", 1);
  unsetenv("AGENTPAY_TEST_UNSET");

  assert(ConfigLoader::ExpandEnvironment("plain") == "plain");
  assert(ConfigLoader::ExpandEnvironment("Bearer ${AGENTPAY_TEST_ADMIN_TOKEN}") == "Bearer from-env");
  assert(ConfigLoader::ExpandEnvironment("${AGENTPAY_TEST_UNSET:-fallback}") == "fallback");
  assert(ConfigLoader::ExpandEnvironment("$${AGENTPAY_TEST_ADMIN_TOKEN}") == "${AGENTPAY_TEST_ADMIN_TOKEN}");

  auto config = ConfigLoader::LoadFromYamlString(R"(principals:
  - name: operator
    api_token: "${AGENTPAY_TEST_ADMIN_TOKEN}"
    capabilities: [admin]
settlement:
  fee_basis_points: ${AGENTPAY_TEST_FEE}
)");
  assert(config.principals(0).api_token() == "from-env");
  assert(config.settlement().fee_basis_points() == 500);

  bool unset = false;
  try {
    (void)ConfigLoader::LoadFromYamlString("logging:\n  level: ${AGENTPAY_TEST_UNSET}\n");
  } catch (const std::runtime_error&) {
    unset = true;
  }
  assert(unset);

  bool unterminated = false;
  try {
    (void)ConfigLoader::ExpandEnvironment("${AGENTPAY_TEST_FEE");
  } catch (const std::runtime_error&) {
    unterminated = true;
  }
  assert(unterminated);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestSettlementSectionKeepsFullPrecision();
  TestPrincipalsAndEmptyDocument();
  TestMissingFileAndNegativeAmounts();
  TestEnvironmentExpansion();

  std::cout << "agentpay_unit_config_loader: pass\n";
  return 0;
}
