#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace bridge::service {

// Wraps one RPC in a span plus request metrics. Failures are logged and rethrown.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::uint64_t request_id, Fn&& fn) {
  bridge::observability::SpanScope span(route);
  if (request_id != 0) {
    span.SetAttribute("request.id", static_cast<std::int64_t>(request_id));
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      bridge::observability::Metrics::Instance().RecordRequest(route, true);
      bridge::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      bridge::observability::Metrics::Instance().RecordRequest(route, true);
      bridge::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    BRIDGE_LOG_ERROR("RPC failed", {bridge::observability::StringField("route", route), bridge::observability::StringField("error", ex.what()),
                                    bridge::observability::UintField("request_id", request_id)});
    bridge::observability::Metrics::Instance().RecordRequest(route, false);
    bridge::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace bridge::service
