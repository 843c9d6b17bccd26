#pragma once
#include <capvault/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace capvault::schema {

// amount_t travels as 32 big-endian bytes. Struct codecs call these for their
// amount fields; every other field goes straight to the library.
void encode_amount(const amount_t& o, ::scale::Encoder& encoder);
void decode_amount(amount_t& o, ::scale::Decoder& decoder);

}  // namespace capvault::schema
