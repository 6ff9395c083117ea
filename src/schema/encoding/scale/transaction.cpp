#include <vigil/schema/encoding/scale/transaction.hpp>

using namespace vigil::schema;

namespace vigil::schema::encoding::scale {

void encode(const initialize<1>&, ::scale::Encoder&) {}

void decode(initialize<1>&, ::scale::Decoder&) {}

void encode(const log_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.authority_owner, encoder);
  encode(o.event_kind, encoder);
  encode(o.content_digest, encoder);
  encode(o.allowed, encoder);
  encode(o.details_length, encoder);
}

void decode(log_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.authority_owner, decoder);
  decode(o.event_kind, decoder);
  decode(o.content_digest, decoder);
  decode(o.allowed, decoder);
  decode(o.details_length, decoder);
}

void encode(const close_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.authority_owner, encoder);
  encode(o.sequence_index, encoder);
}

void decode(close_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.authority_owner, decoder);
  decode(o.sequence_index, decoder);
}

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace vigil::schema::encoding::scale
