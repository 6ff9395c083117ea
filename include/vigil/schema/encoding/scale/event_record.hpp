#pragma once
#include <vigil/schema/event_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace vigil::schema::encoding::scale {

void encode(const event_record<1>& o, ::scale::Encoder& encoder);
void decode(event_record<1>& o, ::scale::Decoder& decoder);

}  // namespace vigil::schema::encoding::scale
