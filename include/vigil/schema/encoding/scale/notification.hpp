#pragma once
#include <vigil/schema/notification.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace vigil::schema::encoding::scale {

void encode(const audit_initialized<1>& o, ::scale::Encoder& encoder);
void decode(audit_initialized<1>& o, ::scale::Decoder& decoder);

void encode(const security_event_logged<1>& o, ::scale::Encoder& encoder);
void decode(security_event_logged<1>& o, ::scale::Decoder& decoder);

void encode(const security_event_closed<1>& o, ::scale::Encoder& encoder);
void decode(security_event_closed<1>& o, ::scale::Decoder& decoder);

}  // namespace vigil::schema::encoding::scale
