#pragma once

#include <cstdint>
#include <string_view>

// Schema type: transaction error code.
// Audit workflow: stable numeric failure codes surfaced verbatim to callers.
// Protocol errors keep the 6000 range used by the deployed audit program.
namespace vigil::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  address_already_occupied = 10,
  record_not_found = 11,
  address_proof_mismatch = 12,
  record_type_mismatch = 13,
  insufficient_funds = 14,
  invalid_event_type = 6000,
  unauthorized_signer = 6001,
  event_count_overflow = 6002,
};

inline constexpr std::string_view to_message(
    const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::invalid_transaction:
      return "invalid transaction";
    case transaction_error_code::unsupported_transaction_version:
      return "unsupported transaction version";
    case transaction_error_code::invalid_chain_id:
      return "invalid chain id";
    case transaction_error_code::invalid_nonce:
      return "invalid nonce";
    case transaction_error_code::signature_verification_failed:
      return "signature verification failed";
    case transaction_error_code::address_already_occupied:
      return "Record address already in use.";
    case transaction_error_code::record_not_found:
      return "No record exists at the derived address.";
    case transaction_error_code::address_proof_mismatch:
      return "Stored address proof does not derive the record address.";
    case transaction_error_code::record_type_mismatch:
      return "Record type tag does not match the expected record.";
    case transaction_error_code::insufficient_funds:
      return "Payer cannot cover the record storage deposit.";
    case transaction_error_code::invalid_event_type:
      return "Invalid event type. Must be 0-3.";
    case transaction_error_code::unauthorized_signer:
      return "Only the audit authority owner can log events.";
    case transaction_error_code::event_count_overflow:
      return "Event count overflow.";
  }
  return "unknown error";
}

}  // namespace vigil::schema
