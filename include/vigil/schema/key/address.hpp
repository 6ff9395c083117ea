#pragma once

#include <vigil/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// Schema key type: derived record addresses.
// Audit workflow: every record lives at an address computed from its seeds,
// so any party can locate (owner) or (owner, index) without a directory.
namespace vigil::schema::key {

inline constexpr std::string_view kAuthoritySeed{"audit-authority"};
inline constexpr std::string_view kEventSeed{"security-event"};
inline constexpr std::string_view kProgramSeed{"vigil-audit-ledger"};
inline constexpr std::string_view kDerivedAddressMarker{
    "ProgramDerivedAddress"};

using seeds_t = std::vector<vigil::schema::bytes_view_t>;

struct derived_address final {
  vigil::schema::address_t address{};
  vigil::schema::address_proof_t proof{};
};

/// Identifier of the audit program; mixed into every derived address.
const vigil::schema::hash32_t& program_id();

/// Address for `seeds` under one specific proof, or std::nullopt when that
/// candidate lands on the Ed25519 curve.
std::optional<vigil::schema::address_t> create_address(
    const seeds_t& seeds,
    vigil::schema::address_proof_t proof);

/// Canonical address for `seeds`: the first off-curve candidate searching
/// proofs from 255 down to 0.
std::optional<derived_address> derive_address(const seeds_t& seeds);

derived_address derive_authority_address(
    const vigil::schema::identity_t& owner);
derived_address derive_event_address(const vigil::schema::identity_t& owner,
                                     uint64_t sequence_index);

/// Re-derive from a stored proof and compare with the accessed address.
bool verify_authority_address(const vigil::schema::address_t& address,
                              const vigil::schema::identity_t& owner,
                              vigil::schema::address_proof_t proof);
bool verify_event_address(const vigil::schema::address_t& address,
                          const vigil::schema::identity_t& owner,
                          uint64_t sequence_index,
                          vigil::schema::address_proof_t proof);

/// First eight bytes of BLAKE3("account:<type_name>").
vigil::schema::type_tag_t make_type_tag(std::string_view type_name);

}  // namespace vigil::schema::key
