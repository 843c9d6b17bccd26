#pragma once
#include <capvault/schema/balance_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE library.
namespace capvault::schema {

void encode(const balance_state<1>& o, ::scale::Encoder& encoder);
void decode(balance_state<1>& o, ::scale::Decoder& decoder);

}  // namespace capvault::schema
