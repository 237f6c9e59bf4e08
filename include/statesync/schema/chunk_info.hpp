#pragma once

#include <statesync/schema/primitives.hpp>

#include <cstdint>
#include <utility>

// Schema type: chunk table entry.
// Contiguous byte range of one file together with the hash of its content.
namespace statesync::schema {

struct chunk_info final {
  // Index of the owning file in the file table.
  uint32_t file_index{};
  uint32_t size_bytes{};
  // Offset of the chunk within the owning file.
  uint64_t offset{};
  hash32_t hash{};

  /// Half-open byte range [offset, offset + size_bytes) inside the file.
  std::pair<uint64_t, uint64_t> byte_range() const {
    return {offset, offset + size_bytes};
  }

  bool operator==(const chunk_info&) const = default;
};

}  // namespace statesync::schema
