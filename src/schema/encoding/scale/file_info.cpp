#include <statesync/schema/encoding/scale/file_info.hpp>

namespace statesync::schema {

void encode(const file_info& o, ::scale::Encoder& encoder) {
  encode(o.relative_path, encoder);
  encode(o.size_bytes, encoder);
  encode(o.hash, encoder);
}

void decode(file_info& o, ::scale::Decoder& decoder) {
  decode(o.relative_path, decoder);
  decode(o.size_bytes, decoder);
  decode(o.hash, decoder);
}

}  // namespace statesync::schema
