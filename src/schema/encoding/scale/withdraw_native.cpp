#include <capvault/schema/encoding/scale/withdraw_native.hpp>
#include <capvault/schema/encoding/scale/primitives.hpp>

namespace capvault::schema {

void encode(const withdraw_native<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  encode_amount(o.amount, encoder);
}

void decode(withdraw_native<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  decode_amount(o.amount, decoder);
}

}  // namespace capvault::schema
