#include <capvault/schema/encoding/scale/primitives.hpp>

namespace capvault::schema {

void encode_amount(const amount_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(to_amount_bytes(o), encoder);
}

void decode_amount(amount_t& o, ::scale::Decoder& decoder) {
  auto bytes = amount_bytes_t{};
  ::scale::decode(bytes, decoder);
  o = from_amount_bytes(bytes);
}

}  // namespace capvault::schema
