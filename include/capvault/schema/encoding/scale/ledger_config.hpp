#pragma once
#include <capvault/schema/ledger_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE library.
namespace capvault::schema {

void encode(const ledger_config<1>& o, ::scale::Encoder& encoder);
void decode(ledger_config<1>& o, ::scale::Decoder& decoder);

}  // namespace capvault::schema
