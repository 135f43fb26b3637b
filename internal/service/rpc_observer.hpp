#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace elevator::service {

/*
  Runs one RPC body inside a span, records request count and latency, and
  logs failures before rethrowing them to the transport adapter.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
    observability::Metrics::Instance().RecordRequest(route, success, elapsed);
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    ELEVATOR_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace elevator::service
