#pragma once

#include <vigil/schema/encoding/scale/encoder.hpp>
#include <vigil/schema/primitives.hpp>
#include <vigil/schema/transaction.hpp>
#include <string_view>

namespace vigil::execution {

inline constexpr auto kChainIdSeed = std::string_view{"vigil-audit-ledger-chain"};

/// Chain id every transaction must carry: BLAKE3 of `kChainIdSeed`.
const vigil::schema::hash32_t& chain_id();

/// Bytes covered by the transaction signature: every envelope field except
/// the signature itself.
vigil::schema::bytes_t make_signing_payload(
    vigil::schema::encoding::encoder<
        vigil::schema::encoding::scale_encoder_tag>& encoder,
    const vigil::schema::transaction_t& tx);

}  // namespace vigil::execution
