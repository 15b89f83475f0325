#pragma once

#include <chrono>
#include <exception>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"

namespace chains::service {

// Runs fn(span) inside a call span, records the call and logs failures before rethrowing.
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  chains::observability::CallSpan span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto record     = [&](bool ok) {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at);
    chains::observability::ChainMetrics::Instance().RecordCall(route, ok, elapsed.count());
  };

  try {
    auto result = fn(span);
    record(true);
    return result;
  } catch (const std::exception& ex) {
    span.Fail(ex.what());
    record(false);
    CHAINS_LOG_ERROR("call failed",
                     {chains::observability::StringField("route", route), chains::observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace chains::service
