#pragma once
#include <statesync/schema/primitives.hpp>
#include <optional>
#include <span>
#include <string>

namespace statesync::schema::encoding {

// The codec is selected at build time through the Library tag. Callers
// alias the specialization they use, e.g.
//   using encoder_t = encoder<scale_encoder_tag>;
// Hot swapping codecs is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  statesync::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, statesync::schema::bytes_t& out);

  template <typename T>
  T decode(const statesync::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const statesync::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const statesync::schema::bytes_view_t& bytes,
                              std::string& error);
};

}  // namespace statesync::schema::encoding
