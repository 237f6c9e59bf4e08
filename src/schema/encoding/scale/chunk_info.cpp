#include <statesync/schema/encoding/scale/chunk_info.hpp>

namespace statesync::schema {

void encode(const chunk_info& o, ::scale::Encoder& encoder) {
  encode(o.file_index, encoder);
  encode(o.size_bytes, encoder);
  encode(o.offset, encoder);
  encode(o.hash, encoder);
}

void decode(chunk_info& o, ::scale::Decoder& decoder) {
  decode(o.file_index, decoder);
  decode(o.size_bytes, decoder);
  decode(o.offset, decoder);
  decode(o.hash, decoder);
}

}  // namespace statesync::schema
