#pragma once

#include <vigil/schema/event_kind.hpp>
#include <vigil/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

// Schema type: event record.
// Audit workflow: a single logged security event. Only the digest and length
// of the detail payload live on the ledger; the payload itself is off-ledger.
namespace vigil::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  static constexpr auto kTypeName = std::string_view{"SecurityEvent"};
  // type tag(8) + owner(32) + kind(1) + digest(32) + allowed(1) +
  // timestamp(8) + sequence_index(8) + details_length(2) + proof(1)
  static constexpr auto kEncodedSize = size_t{93};

  identity_t owner_identity{};
  event_kind_t event_kind{};
  hash32_t content_digest{};
  bool allowed{};
  timestamp_seconds_t timestamp{};
  uint64_t sequence_index{};
  uint16_t details_length{};
  address_proof_t address_proof{};
};

using event_record_t = event_record<1>;

}  // namespace vigil::schema
