#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sentinel::common {

/// Log, flush and terminate. Used for failures the ledger cannot roll back
/// (storage backend errors, corrupted rows, broken internal invariants).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace sentinel::common
