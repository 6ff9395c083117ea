#pragma once

#include <vigil/schema/event_record.hpp>
#include <vigil/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Off-ledger event details. The ledger keeps only a digest and a length;
// anyone holding the details can check them against a stored event.
namespace vigil::execution {

/// SHA-256 of the detail bytes, the digest committed as `content_digest`.
vigil::schema::hash32_t hash_details(std::string_view details);

/// Byte length of `details`, saturated at the width of the stored field.
uint16_t details_length(std::string_view details);

bool verify_event_details(const vigil::schema::event_record_t& record,
                          std::string_view details);

}  // namespace vigil::execution
