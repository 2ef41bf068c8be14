#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace chunkscribe::service {

/*
  Runs one RPC body, logging failures with the route and the duration.
  Exceptions are rethrown unchanged for the transport layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view session_id, Fn&& fn) {
  using chunkscribe::observability::DoubleField;
  using chunkscribe::observability::StringField;

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] { return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count(); };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      CHUNKSCRIBE_LOG_DEBUG("RPC done", {StringField("route", route), DoubleField("duration_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      CHUNKSCRIBE_LOG_DEBUG("RPC done", {StringField("route", route), DoubleField("duration_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    CHUNKSCRIBE_LOG_ERROR("RPC failed", {StringField("route", route), StringField("session_id", session_id), StringField("error", ex.what()),
                                         DoubleField("duration_ms", elapsed_ms())});
    throw;
  }
}

} // namespace chunkscribe::service
