#pragma once
#include <statesync/schema/primitives.hpp>
#include <blake3.h>
#include <boost/endian/buffers.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace statesync::blake3 {

/// Incremental BLAKE3 hasher bound to a domain separator.
///
/// The input starts with dsep(domain) = byte(len(domain)) · domain. Integers
/// are written big-endian with their full width.
class hasher final {
 public:
  explicit hasher(std::string_view domain);

  hasher& write(const statesync::schema::bytes_view_t& bytes);

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  hasher& write(T value) {
    auto buffer = boost::endian::endian_buffer<boost::endian::order::big, T,
                                               sizeof(T) * 8>{value};
    return write(statesync::schema::bytes_view_t{buffer.data(), sizeof(T)});
  }

  /// Length-prefixed byte string: len as u32 · bytes.
  hasher& write_prefixed(const statesync::schema::bytes_view_t& bytes);

  statesync::schema::hash32_t finish() const;

 private:
  blake3_hasher state_{};
};

}  // namespace statesync::blake3
