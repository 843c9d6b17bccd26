#include <capvault/schema/encoding/scale/ledger_info.hpp>
#include <capvault/schema/encoding/scale/primitives.hpp>

namespace capvault::schema {

void encode(const ledger_info<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  encode_amount(o.native_total, encoder);
  encode_amount(o.scaled_deposit_cap, encoder);
  ::scale::encode(o.next_event_id, encoder);
  ::scale::encode(o.state_root, encoder);
}

void decode(ledger_info<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  decode_amount(o.native_total, decoder);
  decode_amount(o.scaled_deposit_cap, decoder);
  ::scale::decode(o.next_event_id, decoder);
  ::scale::decode(o.state_root, decoder);
}

}  // namespace capvault::schema
