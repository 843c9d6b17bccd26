#include <capvault/schema/encoding/scale/deposit_token.hpp>
#include <capvault/schema/encoding/scale/primitives.hpp>

namespace capvault::schema {

void encode(const deposit_token<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  encode_amount(o.amount, encoder);
}

void decode(deposit_token<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  decode_amount(o.amount, decoder);
}

}  // namespace capvault::schema
