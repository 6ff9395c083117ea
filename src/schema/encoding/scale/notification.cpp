#include <vigil/schema/encoding/scale/event_kind.hpp>
#include <vigil/schema/encoding/scale/notification.hpp>

using namespace vigil::schema;

namespace vigil::schema::encoding::scale {

void encode(const audit_initialized<1>& o, ::scale::Encoder& encoder) {
  encode(o.owner_identity, encoder);
  encode(o.timestamp, encoder);
}

void decode(audit_initialized<1>& o, ::scale::Decoder& decoder) {
  decode(o.owner_identity, decoder);
  decode(o.timestamp, decoder);
}

void encode(const security_event_logged<1>& o, ::scale::Encoder& encoder) {
  encode(o.owner_identity, encoder);
  encode(o.sequence_index, encoder);
  encode(o.event_kind, encoder);
  encode(o.allowed, encoder);
  encode(o.content_digest, encoder);
  encode(o.timestamp, encoder);
}

void decode(security_event_logged<1>& o, ::scale::Decoder& decoder) {
  decode(o.owner_identity, decoder);
  decode(o.sequence_index, decoder);
  decode(o.event_kind, decoder);
  decode(o.allowed, decoder);
  decode(o.content_digest, decoder);
  decode(o.timestamp, decoder);
}

void encode(const security_event_closed<1>& o, ::scale::Encoder& encoder) {
  encode(o.owner_identity, encoder);
  encode(o.sequence_index, encoder);
}

void decode(security_event_closed<1>& o, ::scale::Decoder& decoder) {
  decode(o.owner_identity, decoder);
  decode(o.sequence_index, decoder);
}

}  // namespace vigil::schema::encoding::scale
