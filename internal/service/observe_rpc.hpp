#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace labelq::service {

/*
  Wraps one RPC body in a span and records its count and latency.

  Caller mistakes (bad arguments, unknown ids) are logged at WARN and
  rejected reservations are not logged again here, since the lease
  manager already reports them with their reason. Everything else is an
  ERROR.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  labelq::observability::SpanScope span(route);
  const auto                       started_at = std::chrono::steady_clock::now();
  const auto                       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };
  auto& metrics = labelq::observability::Metrics::Instance();

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return;
    } else {
      auto result = fn();
      metrics.RecordRequest(route, true);
      metrics.ObserveRequestLatencyMs(route, elapsed_ms());
      return result;
    }
  } catch (const labelq::util::ReservationInvalid& ex) {
    span.RecordException(ex.what());
    span.SetAttribute("reason", labelq::util::ToString(ex.reason()));
    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, elapsed_ms());
    throw;
  } catch (const std::exception& ex) {
    const double latency = elapsed_ms();
    span.RecordException(ex.what());

    const bool caller_error = dynamic_cast<const labelq::util::ValidationError*>(&ex) != nullptr ||
                              dynamic_cast<const labelq::util::NotFound*>(&ex) != nullptr;
    if (caller_error) {
      LABELQ_LOG_WARN("RPC rejected", {labelq::observability::StringField("route", route), labelq::observability::StringField("error", ex.what()),
                                       labelq::observability::IntField("elapsed_ms", static_cast<std::int64_t>(latency))});
    } else {
      LABELQ_LOG_ERROR("RPC failed", {labelq::observability::StringField("route", route), labelq::observability::StringField("error", ex.what()),
                                      labelq::observability::IntField("elapsed_ms", static_cast<std::int64_t>(latency))});
    }

    metrics.RecordRequest(route, false);
    metrics.ObserveRequestLatencyMs(route, latency);
    throw;
  }
}

} // namespace labelq::service
