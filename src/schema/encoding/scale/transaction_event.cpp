#include <capvault/schema/encoding/scale/transaction_event.hpp>

namespace capvault::schema {

void encode(const event_attribute& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.key, encoder);
  ::scale::encode(o.value, encoder);
  ::scale::encode(o.indexed, encoder);
}

void decode(event_attribute& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.key, decoder);
  ::scale::decode(o.value, decoder);
  ::scale::decode(o.indexed, decoder);
}

void encode(const transaction_event<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.type, encoder);
  ::scale::encode(o.attributes, encoder);
}

void decode(transaction_event<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.type, decoder);
  ::scale::decode(o.attributes, decoder);
}

}  // namespace capvault::schema
