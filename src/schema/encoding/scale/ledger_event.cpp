#include <capvault/schema/encoding/scale/asset_kind.hpp>
#include <capvault/schema/encoding/scale/ledger_event.hpp>
#include <capvault/schema/encoding/scale/ledger_event_type.hpp>
#include <capvault/schema/encoding/scale/primitives.hpp>

namespace capvault::schema {

void encode(const ledger_event<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.event_id, encoder);
  ::scale::encode(o.type, encoder);
  ::scale::encode(o.account, encoder);
  ::scale::encode(o.asset, encoder);
  encode_amount(o.amount, encoder);
}

void decode(ledger_event<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.event_id, decoder);
  ::scale::decode(o.type, decoder);
  ::scale::decode(o.account, decoder);
  ::scale::decode(o.asset, decoder);
  decode_amount(o.amount, decoder);
}

}  // namespace capvault::schema
