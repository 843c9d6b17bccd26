#include <capvault/schema/encoding/scale/deposit_native.hpp>
#include <capvault/schema/encoding/scale/deposit_token.hpp>
#include <capvault/schema/encoding/scale/transaction.hpp>
#include <capvault/schema/encoding/scale/withdraw_native.hpp>
#include <capvault/schema/encoding/scale/withdraw_token.hpp>

namespace capvault::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.caller, encoder);
  ::scale::encode(o.payload, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.caller, decoder);
  ::scale::decode(o.payload, decoder);
}

}  // namespace capvault::schema
