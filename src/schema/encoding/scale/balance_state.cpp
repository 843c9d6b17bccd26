#include <capvault/schema/encoding/scale/balance_state.hpp>
#include <capvault/schema/encoding/scale/primitives.hpp>

namespace capvault::schema {

void encode(const balance_state<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  encode_amount(o.native_amount, encoder);
  encode_amount(o.token_amount, encoder);
}

void decode(balance_state<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  decode_amount(o.native_amount, decoder);
  decode_amount(o.token_amount, decoder);
}

}  // namespace capvault::schema
