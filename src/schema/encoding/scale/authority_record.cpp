#include <vigil/schema/encoding/scale/authority_record.hpp>

using namespace vigil::schema;

namespace vigil::schema::encoding::scale {

void encode(const authority_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.owner_identity, encoder);
  encode(o.event_count, encoder);
  encode(o.created_at, encoder);
  encode(o.address_proof, encoder);
}

void decode(authority_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.owner_identity, decoder);
  decode(o.event_count, decoder);
  decode(o.created_at, decoder);
  decode(o.address_proof, decoder);
}

}  // namespace vigil::schema::encoding::scale
