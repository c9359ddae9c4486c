#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace agentpay::observability;

void TestFieldFormatting() {
  assert(FormatFields({}) == "");
  assert(FormatFields({StringField("payment_id", "0xab"), UintField("amount", 10'000'000)}) ==
         "payment_id=0xab amount=10000000");
  assert(FormatFields({IntField("delta", -3), BoolField("active", false)}) == "delta=-3 active=false");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatFields({StringField("error", "insufficient funds")}) == "error=\"insufficient funds\"");
  assert(FormatFields({StringField("detail", "a=\"b\"\n")}) == "detail=\"a=\\\"b\\\"\\n\"");
  assert(FormatFields({StringField("note", "")}) == "note=\"\"");
}

void TestSecretsAreRedacted() {
  assert(IsSecretFieldKey("token"));
  assert(IsSecretFieldKey("api_token"));
  assert(IsSecretFieldKey("Signing_Key"));
  assert(IsSecretFieldKey("authorization_signature"));
  assert(!IsSecretFieldKey("token_address"));
  assert(!IsSecretFieldKey("payer"));

  const auto line = FormatFields({StringField("api_token", "admin-token"), StringField("payer", "0x01")});
  assert(line == "api_token=<redacted> payer=0x01");
  assert(line.find("admin-token") == std::string::npos);
}

void TestLevelParsing() {
  assert(ParseLogLevel("debug") == spdlog::level::debug);
  assert(ParseLogLevel("WARNING") == spdlog::level::warn);
  assert(ParseLogLevel("err") == spdlog::level::err);
  assert(ParseLogLevel("off") == spdlog::level::off);

  bool rejected = false;
  try {
    (void)ParseLogLevel("verbose");
  } catch (const agentpay::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
}

void TestInitializeRejectsUnknownLevel() {
  unsetenv("AGENTPAY_LOG_LEVEL");

  agentpay::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("loud");
  bool rejected = false;
  try {
    InitializeLogging(config);
  } catch (const agentpay::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);

  config.mutable_logging()->set_level("error");
  InitializeLogging(config);
  assert(spdlog::default_logger()->level() == spdlog::level::err);
  AGENTPAY_LOG_INFO("suppressed below error", {StringField("payer", "0x01")});
  ShutdownLogging();
}

} // namespace

int main() {
  TestFieldFormatting();
  TestValuesWithSpacesAreQuoted();
  TestSecretsAreRedacted();
  TestLevelParsing();
  TestInitializeRejectsUnknownLevel();

  std::cout << "agentpay_unit_logging: pass\n";
  return 0;
}
