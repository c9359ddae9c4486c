#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace agentpay::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Counter       = opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& otlp_config) {
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = otlp_config.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = otlp_config.endpoint;
  options.use_ssl_credentials = !otlp_config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

// AttributeValue holds a view, so the string has to outlive the Add call.
void AddWithLabel(const Counter& counter, std::uint64_t value, const char* label, std::string_view label_value) {
  if (!counter) {
    return;
  }
  const std::string                          owned(label_value);
  const std::initializer_list<AttributePair> attributes = {{label, owned}};
  counter->Add(value, attributes, opentelemetry::context::Context{});
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  Counter                                                          request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>> request_latency_ms;
  Counter                                                          settlement_count;
  Counter                                                          settled_amount;
  Counter                                                          settled_fee;
  Counter                                                          call_count;
  Counter                                                          withdrawal_count;
  Counter                                                          withdrawn_amount;
};

bool InitializeMetrics(const agentpay::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config, OtlpSignal::kMetrics);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(otlp_config), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  AGENTPAY_LOG_INFO("metrics enabled", {StringField("endpoint", otlp_config.endpoint),
                                        UintField("export_interval_ms", otlp_config.export_interval_ms)});
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("agentpay.settlement", "0.1.0");
  auto& meter  = *impl_->meter;

  impl_->request_count      = meter.CreateUInt64Counter("agentpay.rpc.count", "RPCs handled, by route and success", "1");
  impl_->request_latency_ms = meter.CreateDoubleHistogram("agentpay.rpc.latency_ms", "RPC handling latency", "ms");
  impl_->settlement_count   = meter.CreateUInt64Counter("agentpay.settlement.count", "Settlement attempts by outcome", "1");
  impl_->settled_amount     = meter.CreateUInt64Counter("agentpay.settlement.amount", "Gross settled volume", "{base_unit}");
  impl_->settled_fee        = meter.CreateUInt64Counter("agentpay.settlement.fee", "Fees credited to the treasury", "{base_unit}");
  impl_->call_count         = meter.CreateUInt64Counter("agentpay.entitlement.calls", "Per-call credits consumed, by outcome", "1");
  impl_->withdrawal_count   = meter.CreateUInt64Counter("agentpay.revenue.withdrawals", "Withdrawal attempts by outcome", "1");
  impl_->withdrawn_amount   = meter.CreateUInt64Counter("agentpay.revenue.withdrawn", "Revenue paid out to beneficiaries", "{base_unit}");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_->request_count) {
    return;
  }
  const std::string                          owned(route);
  const std::initializer_list<AttributePair> attributes = {{"route", owned}, {"success", success}};
  impl_->request_count->Add(1, attributes, opentelemetry::context::Context{});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_->request_latency_ms) {
    return;
  }
  const std::string                          owned(route);
  const std::initializer_list<AttributePair> attributes = {{"route", owned}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordSettlement(std::string_view outcome) {
  AddWithLabel(impl_->settlement_count, 1, "outcome", outcome);
}

void Metrics::AddSettledVolume(std::uint64_t amount, std::uint64_t fee) {
  if (impl_->settled_amount) {
    impl_->settled_amount->Add(amount);
  }
  if (impl_->settled_fee && fee > 0) {
    impl_->settled_fee->Add(fee);
  }
}

void Metrics::RecordCallConsumed(std::string_view outcome) {
  AddWithLabel(impl_->call_count, 1, "outcome", outcome);
}

void Metrics::RecordWithdrawal(std::string_view outcome, std::uint64_t amount) {
  AddWithLabel(impl_->withdrawal_count, 1, "outcome", outcome);
  if (outcome == "ok" && impl_->withdrawn_amount) {
    impl_->withdrawn_amount->Add(amount);
  }
}

} // namespace agentpay::observability

#else

namespace agentpay::observability {

bool InitializeMetrics(const agentpay::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownMetrics() {
}

Metrics::Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view, bool) {
}

void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

void Metrics::RecordSettlement(std::string_view) {
}

void Metrics::AddSettledVolume(std::uint64_t, std::uint64_t) {
}

void Metrics::RecordCallConsumed(std::string_view) {
}

void Metrics::RecordWithdrawal(std::string_view, std::uint64_t) {
}

} // namespace agentpay::observability

#endif
