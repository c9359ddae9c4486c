#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace agentpay::observability {
namespace {

const char* NonEmptyEnv(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

std::string DefaultEndpoint(OtlpTransport transport, OtlpSignal signal) {
  if (transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpConfig ResolveOtlpConfig(const agentpay::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpConfig resolved;
  resolved.transport = observability.transport() == agentpay::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                   : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    resolved.service_name = observability.service_name();
  }
  if (observability.metrics_export_interval_ms() > 0) {
    resolved.export_interval_ms = observability.metrics_export_interval_ms();
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (!observability.otlp_endpoint().empty()) {
    resolved.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = NonEmptyEnv(signal_env)) {
    resolved.endpoint = endpoint;
  } else if (const char* endpoint = NonEmptyEnv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    resolved.endpoint = endpoint;
  } else {
    resolved.endpoint = DefaultEndpoint(resolved.transport, signal);
  }

  resolved.insecure = resolved.endpoint.rfind("https://", 0) != 0;
  return resolved;
}

} // namespace agentpay::observability
