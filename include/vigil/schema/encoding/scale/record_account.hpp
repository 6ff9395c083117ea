#pragma once
#include <vigil/schema/record_account.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace vigil::schema::encoding::scale {

void encode(const record_account<1>& o, ::scale::Encoder& encoder);
void decode(record_account<1>& o, ::scale::Decoder& decoder);

}  // namespace vigil::schema::encoding::scale
