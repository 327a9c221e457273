#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace songqueue::service {

/*
  Wraps one service call in a span, request metrics and failure logging.
  Exceptions are rethrown unchanged for the transport to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  songqueue::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("songqueue.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      songqueue::observability::Metrics::Instance().RecordRequest(route, true);
      songqueue::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      songqueue::observability::Metrics::Instance().RecordRequest(route, true);
      songqueue::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SONGQUEUE_LOG_ERROR("RPC failed", {songqueue::observability::StringField("route", route),
                                       songqueue::observability::StringField("error", ex.what()),
                                       songqueue::observability::StringField("subject", subject)});
    songqueue::observability::Metrics::Instance().RecordRequest(route, false);
    songqueue::observability::Metrics::Instance().ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  }
}

} // namespace songqueue::service
