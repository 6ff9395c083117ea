#pragma once
#include <vigil/schema/primitives.hpp>

// Schema type: close event.
// Audit workflow: destroys one event record of `authority_owner`, which must
// be the signer, and refunds its storage deposit to the signer.
namespace vigil::schema {

template <uint16_t Version>
struct close_event;

template <>
struct close_event<1> final {
  identity_t authority_owner{};
  uint64_t sequence_index{};
};

using close_event_t = close_event<1>;

}  // namespace vigil::schema
