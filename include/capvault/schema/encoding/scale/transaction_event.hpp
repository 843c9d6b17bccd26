#pragma once
#include <capvault/schema/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE library.
namespace capvault::schema {

void encode(const event_attribute& o, ::scale::Encoder& encoder);
void decode(event_attribute& o, ::scale::Decoder& decoder);

void encode(const transaction_event<1>& o, ::scale::Encoder& encoder);
void decode(transaction_event<1>& o, ::scale::Decoder& decoder);

}  // namespace capvault::schema
