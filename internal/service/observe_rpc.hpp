#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace tasktree::service {

/*
  Runs one service operation inside a span, records request count and
  latency, logs failures and rethrows them for the transport adapter.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view task_id, Fn&& fn) {
  tasktree::observability::SpanScope span(route);
  if (!task_id.empty()) {
    span.SetAttribute("task.id", task_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       record     = [&](bool ok) {
    tasktree::observability::Metrics::Instance().RecordRequest(route, ok);
    tasktree::observability::Metrics::Instance().ObserveRequestLatencyMs(
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
    TASKTREE_LOG_ERROR("RPC failed", {tasktree::observability::StringField("route", route), tasktree::observability::StringField("error", ex.what()),
                                      tasktree::observability::StringField("task_id", task_id)});
    record(false);
    throw;
  }
}

} // namespace tasktree::service
