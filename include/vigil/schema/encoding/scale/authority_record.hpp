#pragma once
#include <vigil/schema/authority_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace vigil::schema::encoding::scale {

void encode(const authority_record<1>& o, ::scale::Encoder& encoder);
void decode(authority_record<1>& o, ::scale::Decoder& decoder);

}  // namespace vigil::schema::encoding::scale
