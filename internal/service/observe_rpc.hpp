#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace agentpay::service {

/*
  Wraps one service call in a span, request count/latency metrics and an
  error log line. Exceptions are rethrown unchanged.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view principal, Fn&& fn) {
  agentpay::observability::SpanScope span(route);
  if (!principal.empty()) {
    span.SetAttribute("principal", principal);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool success) {
    agentpay::observability::Metrics::Instance().RecordRequest(route, success);
    agentpay::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      record(true);
      return;
    } else {
      auto result = fn();
      record(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    AGENTPAY_LOG_ERROR("RPC failed", {agentpay::observability::StringField("route", route),
                                      agentpay::observability::StringField("principal", principal),
                                      agentpay::observability::StringField("error", ex.what())});
    record(false);
    throw;
  }
}

} // namespace agentpay::service
