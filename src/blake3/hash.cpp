#include <statesync/blake3/hash.hpp>
#include <statesync/common/critical.hpp>

#include <limits>

namespace statesync::blake3 {

hasher::hasher(std::string_view domain) {
  if (domain.size() > std::numeric_limits<uint8_t>::max()) {
    statesync::common::critical("hash domain separator is too long");
  }
  blake3_hasher_init(&state_);
  write(static_cast<uint8_t>(domain.size()));
  write(statesync::schema::make_bytes_view(domain));
}

hasher& hasher::write(const statesync::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::write_prefixed(const statesync::schema::bytes_view_t& bytes) {
  write(static_cast<uint32_t>(bytes.size()));
  return write(bytes);
}

statesync::schema::hash32_t hasher::finish() const {
  // BLAKE3_OUT_LEN
  auto output = statesync::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

}  // namespace statesync::blake3
