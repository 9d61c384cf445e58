#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace paulette::common {

/// Log, flush and terminate. Reserved for broken process invariants such as
/// storage I/O failures; operation-level failures are reported as results.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace paulette::common
