#pragma once

#include <vigil/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace vigil::execution {

/// Wall clock used to stamp records, in unix seconds.
using time_source_t = std::function<vigil::schema::timestamp_seconds_t()>;

inline time_source_t make_system_time_source() {
  return [] {
    return static_cast<vigil::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace vigil::execution
