#pragma once

#include <vigil/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event kind.
// Audit workflow: classifies which agent guard produced a security event.
namespace vigil::schema {

enum class event_kind_t : uint8_t {
  transaction_check = 0,
  injection_detected = 1,
  secret_leak_caught = 2,
  general_action = 3,
};

inline constexpr auto kMaxEventKind =
    static_cast<uint8_t>(event_kind_t::general_action);

inline constexpr auto kEventKindMappings =
    std::array{std::pair<std::string_view, event_kind_t>{
                   "transaction_check", event_kind_t::transaction_check},
               std::pair<std::string_view, event_kind_t>{
                   "injection_detected", event_kind_t::injection_detected},
               std::pair<std::string_view, event_kind_t>{
                   "secret_leak_caught", event_kind_t::secret_leak_caught},
               std::pair<std::string_view, event_kind_t>{
                   "general_action", event_kind_t::general_action}};

template <>
inline std::optional<event_kind_t> try_from_string<event_kind_t>(
    const std::string_view value) {
  return from_string(value, kEventKindMappings);
}

inline constexpr std::string_view to_string(const event_kind_t value) {
  return to_string(value, kEventKindMappings).value_or("unknown");
}

/// Map a wire value onto a known kind; values above 3 have no kind.
inline constexpr std::optional<event_kind_t> try_make_event_kind(
    const uint8_t value) {
  if (value > kMaxEventKind) {
    return std::nullopt;
  }
  return static_cast<event_kind_t>(value);
}

}  // namespace vigil::schema
