#pragma once

#include <vigil/schema/primitives.hpp>

#include <array>
#include <optional>

namespace vigil::crypto {

using ed25519_seed_t = std::array<uint8_t, 32>;

bool available();

bool verify_signature(const vigil::schema::bytes_view_t& message,
                      const vigil::schema::identity_t& signer,
                      const vigil::schema::signature_t& signature);

/// Derive the Ed25519 public key (the ledger identity) for a secret seed.
std::optional<vigil::schema::identity_t> derive_identity(
    const ed25519_seed_t& seed);

/// Sign `message` with the Ed25519 key expanded from `seed`.
std::optional<vigil::schema::signature_t> sign(
    const vigil::schema::bytes_view_t& message,
    const ed25519_seed_t& seed);

/// SHA-256 of `message`; empty only when OpenSSL cannot run the digest.
std::optional<vigil::schema::hash32_t> sha256(
    const vigil::schema::bytes_view_t& message);

}  // namespace vigil::crypto
