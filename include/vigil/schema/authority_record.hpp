#pragma once

#include <vigil/schema/primitives.hpp>

#include <cstdint>
#include <string_view>

// Schema type: authority record.
// Audit workflow: one per agent identity; owns the event counter that
// sequences every security event the identity logs.
namespace vigil::schema {

template <uint16_t Version>
struct authority_record;

template <>
struct authority_record<1> final {
  static constexpr auto kTypeName = std::string_view{"AuditAuthority"};
  // type tag(8) + owner(32) + event_count(8) + created_at(8) + proof(1)
  static constexpr auto kEncodedSize = size_t{57};

  identity_t owner_identity{};
  uint64_t event_count{};
  timestamp_seconds_t created_at{};
  address_proof_t address_proof{};
};

using authority_record_t = authority_record<1>;

}  // namespace vigil::schema
