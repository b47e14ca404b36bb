#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace fleet::service {

struct RpcSubject {
  std::string_view device_id;
  uint64_t         action_id = 0;
};

/*
  Wraps one service call: span named after the route, request count and
  latency, and an error log line before the exception is rethrown to the
  transport adapter.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, RpcSubject subject, Fn&& fn) {
  observability::SpanScope span(route);
  if (!subject.device_id.empty()) {
    span.SetAttribute("device.id", subject.device_id);
  }
  if (subject.action_id != 0) {
    span.SetAttribute("action.id", static_cast<std::int64_t>(subject.action_id));
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(route, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
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
    FLEET_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                   observability::StringField("device_id", subject.device_id),
                                   observability::IntField("action_id", static_cast<std::int64_t>(subject.action_id))});
    finish(false);
    throw;
  }
}

} // namespace fleet::service
