#pragma once
#include <statesync/schema/file_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared next to the type so the SCALE library finds them by argument
// dependent lookup.
namespace statesync::schema {

void encode(const file_info& o, ::scale::Encoder& encoder);
void decode(file_info& o, ::scale::Decoder& decoder);

}  // namespace statesync::schema
