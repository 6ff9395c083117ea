#pragma once
#include <vigil/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace vigil::schema::key {

/// Concatenates raw key segments without any length framing. Callers only
/// combine fixed width segments behind a fixed prefix.
struct builder final {
  vigil::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
};

}  // namespace vigil::schema::key
