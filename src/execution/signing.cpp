#include <vigil/blake3/hash.hpp>
#include <vigil/execution/signing.hpp>
#include <tuple>

namespace vigil::execution {

const vigil::schema::hash32_t& chain_id() {
  static const auto id = vigil::blake3::hash(kChainIdSeed);
  return id;
}

vigil::schema::bytes_t make_signing_payload(
    vigil::schema::encoding::encoder<
        vigil::schema::encoding::scale_encoder_tag>& encoder,
    const vigil::schema::transaction_t& tx) {
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

}  // namespace vigil::execution
