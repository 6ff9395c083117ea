#pragma once

#include <vigil/schema/event_kind.hpp>
#include <vigil/schema/primitives.hpp>

#include <cstdint>
#include <variant>

// Schema type: notification.
// Audit workflow: state change announcements consumed by external indexers
// and observers. Emitted only for operations that committed.
namespace vigil::schema {

template <uint16_t Version>
struct audit_initialized;

template <>
struct audit_initialized<1> final {
  identity_t owner_identity{};
  timestamp_seconds_t timestamp{};
};

using audit_initialized_t = audit_initialized<1>;

template <uint16_t Version>
struct security_event_logged;

template <>
struct security_event_logged<1> final {
  identity_t owner_identity{};
  uint64_t sequence_index{};
  event_kind_t event_kind{};
  bool allowed{};
  hash32_t content_digest{};
  timestamp_seconds_t timestamp{};
};

using security_event_logged_t = security_event_logged<1>;

template <uint16_t Version>
struct security_event_closed;

template <>
struct security_event_closed<1> final {
  identity_t owner_identity{};
  uint64_t sequence_index{};
};

using security_event_closed_t = security_event_closed<1>;

using notification_t = std::variant<audit_initialized_t,
                                    security_event_logged_t,
                                    security_event_closed_t>;

}  // namespace vigil::schema
