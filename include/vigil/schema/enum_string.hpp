#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace vigil::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto found = std::ranges::find(mappings, value,
                                 &std::pair<std::string_view, Enum>::first);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->second;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings) {
  auto found = std::ranges::find(mappings, value,
                                 &std::pair<std::string_view, Enum>::second);
  if (found == std::end(mappings)) {
    return std::nullopt;
  }
  return found->first;
}

/// Parse a textual enum name; specialized next to each enum's mappings.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace vigil::schema
