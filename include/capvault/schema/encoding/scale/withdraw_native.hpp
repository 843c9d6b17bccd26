#pragma once
#include <capvault/schema/withdraw_native.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE library.
namespace capvault::schema {

void encode(const withdraw_native<1>& o, ::scale::Encoder& encoder);
void decode(withdraw_native<1>& o, ::scale::Decoder& decoder);

}  // namespace capvault::schema
