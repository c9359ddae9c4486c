#include <cassert>
#include <cstdlib>
#include <iostream>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace {

using agentpay::observability::OtlpSignal;
using agentpay::observability::OtlpTransport;
using agentpay::observability::ResolveOtlpConfig;
using agentpay::runtime::config::RuntimeConfig;

void ClearEnvironment() {
  unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

void TestDefaultsPerTransport() {
  ClearEnvironment();
  RuntimeConfig config;

  auto grpc = ResolveOtlpConfig(config, OtlpSignal::kTraces);
  assert(grpc.transport == OtlpTransport::kGrpc);
  assert(grpc.endpoint == "localhost:4317");
  assert(grpc.insecure);
  assert(grpc.service_name == "agentpay-settlement");
  assert(grpc.export_interval_ms == 1000);

  config.mutable_observability()->set_transport(agentpay::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(ResolveOtlpConfig(config, OtlpSignal::kTraces).endpoint == "http://localhost:4318/v1/traces");
  assert(ResolveOtlpConfig(config, OtlpSignal::kMetrics).endpoint == "http://localhost:4318/v1/metrics");
}

void TestEnvironmentPrecedence() {
  ClearEnvironment();
  RuntimeConfig config;

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "collector:4317", 1);
  assert(ResolveOtlpConfig(config, OtlpSignal::kMetrics).endpoint == "collector:4317");

  setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "metrics-collector:4317", 1);
  assert(ResolveOtlpConfig(config, OtlpSignal::kMetrics).endpoint == "metrics-collector:4317");
  assert(ResolveOtlpConfig(config, OtlpSignal::kTraces).endpoint == "collector:4317");

  config.mutable_observability()->set_otlp_endpoint("configured:4317");
  assert(ResolveOtlpConfig(config, OtlpSignal::kMetrics).endpoint == "configured:4317");
  ClearEnvironment();
}

void TestConfiguredOverrides() {
  ClearEnvironment();
  RuntimeConfig config;
  auto* observability = config.mutable_observability();
  observability->set_service_name("agentpay-staging");
  observability->set_metrics_export_interval_ms(250);
  observability->set_otlp_endpoint("https://otel.example.net:4317");

  const auto resolved = ResolveOtlpConfig(config, OtlpSignal::kMetrics);
  assert(resolved.service_name == "agentpay-staging");
  assert(resolved.export_interval_ms == 250);
  assert(!resolved.insecure);
}

} // namespace

int main() {
  TestDefaultsPerTransport();
  TestEnvironmentPrecedence();
  TestConfiguredOverrides();

  std::cout << "agentpay_unit_otlp_config: pass\n";
  return 0;
}
