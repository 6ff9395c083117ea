#pragma once
#include <vigil/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace vigil::schema::encoding::scale {

void encode(const initialize<1>& o, ::scale::Encoder& encoder);
void decode(initialize<1>& o, ::scale::Decoder& decoder);

void encode(const log_event<1>& o, ::scale::Encoder& encoder);
void decode(log_event<1>& o, ::scale::Decoder& decoder);

void encode(const close_event<1>& o, ::scale::Encoder& encoder);
void decode(close_event<1>& o, ::scale::Decoder& decoder);

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace vigil::schema::encoding::scale
