#include <capvault/schema/encoding/scale/ledger_config.hpp>
#include <capvault/schema/encoding/scale/primitives.hpp>

namespace capvault::schema {

void encode(const ledger_config<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  encode_amount(o.deposit_cap, encoder);
  ::scale::encode(o.oracle_decimals, encoder);
  ::scale::encode(o.native_decimals, encoder);
  ::scale::encode(o.ledger_account, encoder);
}

void decode(ledger_config<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  decode_amount(o.deposit_cap, decoder);
  ::scale::decode(o.oracle_decimals, decoder);
  ::scale::decode(o.native_decimals, decoder);
  ::scale::decode(o.ledger_account, decoder);
}

}  // namespace capvault::schema
