#include <vigil/schema/encoding/scale/record_account.hpp>

using namespace vigil::schema;

namespace vigil::schema::encoding::scale {

void encode(const record_account<1>& o, ::scale::Encoder& encoder) {
  encode(o.lamports, encoder);
  encode(o.data, encoder);
}

void decode(record_account<1>& o, ::scale::Decoder& decoder) {
  decode(o.lamports, decoder);
  decode(o.data, decoder);
}

}  // namespace vigil::schema::encoding::scale
