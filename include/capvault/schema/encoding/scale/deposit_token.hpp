#pragma once
#include <capvault/schema/deposit_token.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE library.
namespace capvault::schema {

void encode(const deposit_token<1>& o, ::scale::Encoder& encoder);
void decode(deposit_token<1>& o, ::scale::Decoder& decoder);

}  // namespace capvault::schema
