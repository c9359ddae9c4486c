#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace agentpay::runtime::config {
class RuntimeConfig;
}

namespace agentpay::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"agentpay-settlement"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

/*
  Exporter settings for one signal.

  Endpoint precedence: config file, then the signal-specific
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default for the transport. An https:// endpoint turns
  off the insecure gRPC channel.
*/
OtlpConfig ResolveOtlpConfig(const agentpay::runtime::config::RuntimeConfig& config, OtlpSignal signal);

// Without ENABLE_OTEL these report false and spans/metrics record nothing.
bool InitializeTracing(const agentpay::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const agentpay::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, std::uint64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// Amounts are token base units. Outcomes are "ok" or a short error class name.
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordSettlement(std::string_view outcome);
  void AddSettledVolume(std::uint64_t amount, std::uint64_t fee);
  void RecordCallConsumed(std::string_view outcome);
  void RecordWithdrawal(std::string_view outcome, std::uint64_t amount);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

} // namespace agentpay::observability
