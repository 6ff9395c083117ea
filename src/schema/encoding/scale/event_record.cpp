#include <vigil/schema/encoding/scale/event_kind.hpp>
#include <vigil/schema/encoding/scale/event_record.hpp>

using namespace vigil::schema;

namespace vigil::schema::encoding::scale {

void encode(const event_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.owner_identity, encoder);
  encode(o.event_kind, encoder);
  encode(o.content_digest, encoder);
  encode(o.allowed, encoder);
  encode(o.timestamp, encoder);
  encode(o.sequence_index, encoder);
  encode(o.details_length, encoder);
  encode(o.address_proof, encoder);
}

void decode(event_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.owner_identity, decoder);
  decode(o.event_kind, decoder);
  decode(o.content_digest, decoder);
  decode(o.allowed, decoder);
  decode(o.timestamp, decoder);
  decode(o.sequence_index, decoder);
  decode(o.details_length, decoder);
  decode(o.address_proof, decoder);
}

}  // namespace vigil::schema::encoding::scale
