#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

namespace obs = agentpay::observability;

namespace {

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

void PrintUsage() {
  std::cerr << "Usage: agentpay-settlement [--check-config] [--config] <config.yaml>\n"
               "       the config path may also come from AGENTPAY_CONFIG\n";
}

struct Options {
  std::string config_path;
  bool        check_only = false;
};

bool ParseOptions(int argc, char** argv, Options& options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      options.check_only = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) return false;
      options.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && options.config_path.empty()) {
      options.config_path = arg;
    } else {
      return false;
    }
  }
  if (options.config_path.empty()) {
    if (const char* env = std::getenv("AGENTPAY_CONFIG")) {
      options.config_path = env;
    }
  }
  return !options.config_path.empty();
}

void ShutdownObservability() {
  obs::ShutdownMetrics();
  obs::ShutdownTracing();
  obs::ShutdownLogging();
}

void LogLedgerSummary(const agentpay::factory::RuntimeDependencies& deps) {
  const auto fee   = deps.engine->GetFeeConfig();
  const auto stats = deps.engine->Stats();
  AGENTPAY_LOG_INFO("ledger ready", {obs::StringField("settlement_address", deps.engine->config().settlement_address),
                                     obs::UintField("fee_basis_points", fee.fee_basis_points), obs::StringField("treasury", fee.treasury),
                                     obs::UintField("consumed_payments", stats.consumed_payments),
                                     obs::UintField("outstanding_revenue", stats.outstanding_revenue),
                                     obs::UintField("last_event_sequence", stats.last_event_sequence)});
}

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseOptions(argc, argv, options)) {
    PrintUsage();
    return 1;
  }

  try {
    auto config = agentpay::config::ConfigLoader::LoadFromYaml(options.config_path);

    // logging first so exporter setup is reported through it
    obs::InitializeLogging(config);
    obs::InitializeTracing(config);
    obs::InitializeMetrics(config);

    auto deps = agentpay::factory::BuildRuntime(config);
    LogLedgerSummary(deps);

    if (options.check_only) {
      AGENTPAY_LOG_INFO("config ok", {obs::StringField("path", options.config_path)});
      ShutdownObservability();
      return 0;
    }

    agentpay::runtime::Server server(config.server().bind_address(), agentpay::runtime::BuildGrpcServices(deps));

    // handlers go in before Start so an early SIGTERM still stops cleanly
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    AGENTPAY_LOG_INFO("agentpay settlement listening",
                      {obs::StringField("bind_address", config.server().bind_address()), obs::IntField("port", server.SelectedPort())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    AGENTPAY_LOG_INFO("agentpay settlement stopping", {obs::UintField("last_event_sequence", deps.engine->Stats().last_event_sequence)});
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    AGENTPAY_LOG_ERROR("agentpay settlement failed", {obs::StringField("error", e.what()), obs::StringField("config", options.config_path)});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
