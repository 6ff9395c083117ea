#pragma once
#include <vigil/schema/primitives.hpp>

// Schema type: log event.
// Audit workflow: appends one security event to the ledger of
// `authority_owner`, which must be the signer.
// `event_kind` stays a raw byte on the wire so out of range kinds reach the
// protocol and are rejected there.
namespace vigil::schema {

template <uint16_t Version>
struct log_event;

template <>
struct log_event<1> final {
  identity_t authority_owner{};
  uint8_t event_kind{};
  hash32_t content_digest{};
  bool allowed{};
  uint16_t details_length{};
};

using log_event_t = log_event<1>;

}  // namespace vigil::schema
