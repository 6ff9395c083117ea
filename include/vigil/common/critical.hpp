#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace vigil::common {

/// Log an unrecoverable fault and terminate the process.
///
/// Reserved for storage and encoding faults that cannot be reported as a
/// transaction result without leaving the ledger in an unknown state.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace vigil::common
