#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace statesync::schema {

enum class manifest_error_code : uint32_t {
  ok = 0,
  // Unknown version integer, or one above the maximum supported version.
  version_unsupported = 1,
  // The codec could not parse the bytes.
  decode_failed = 2,
  // Recomputed hash differs from the declared or trusted one.
  hash_mismatch = 3,
  // Out-of-range file index, gaps or overlaps in chunk offsets, bad sizes.
  invalid_structure = 4,
};

struct manifest_error final {
  manifest_error_code code{manifest_error_code::ok};
  std::string message;
};

inline constexpr std::string_view to_string(const manifest_error_code code) {
  switch (code) {
    case manifest_error_code::ok:
      return "ok";
    case manifest_error_code::version_unsupported:
      return "version_unsupported";
    case manifest_error_code::decode_failed:
      return "decode_failed";
    case manifest_error_code::hash_mismatch:
      return "hash_mismatch";
    case manifest_error_code::invalid_structure:
      return "invalid_structure";
  }
  return "unknown";
}

}  // namespace statesync::schema
