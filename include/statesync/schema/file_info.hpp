#pragma once

#include <statesync/schema/primitives.hpp>

#include <cstdint>
#include <string>

// Schema type: file table entry.
// One file of a checkpoint; hash covers the file's chunk table slice.
namespace statesync::schema {

struct file_info final {
  // Path relative to the checkpoint root.
  std::string relative_path;
  uint64_t size_bytes{};
  hash32_t hash{};

  bool operator==(const file_info&) const = default;
};

}  // namespace statesync::schema
