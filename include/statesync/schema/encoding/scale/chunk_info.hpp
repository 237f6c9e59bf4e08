#pragma once
#include <statesync/schema/chunk_info.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace statesync::schema {

void encode(const chunk_info& o, ::scale::Encoder& encoder);
void decode(chunk_info& o, ::scale::Decoder& decoder);

}  // namespace statesync::schema
