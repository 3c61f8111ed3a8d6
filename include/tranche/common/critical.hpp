#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace tranche::common {

/// Log, flush every sink and stop the process. Reserved for storage faults and
/// broken ledger invariants; rejected operations return an error code instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

/// Logs the formatted details before the one-line reason.
template <typename... Args>
[[noreturn]] void critical(const std::string_view message,
                           spdlog::format_string_t<Args...> details,
                           Args&&... args) {
  spdlog::critical(details, std::forward<Args>(args)...);
  critical(message);
}

}  // namespace tranche::common
