#pragma once
#include <capvault/schema/ledger_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE library.
namespace capvault::schema {

void encode(const ledger_event<1>& o, ::scale::Encoder& encoder);
void decode(ledger_event<1>& o, ::scale::Decoder& decoder);

}  // namespace capvault::schema
