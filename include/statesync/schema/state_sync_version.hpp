#pragma once

#include <statesync/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: state sync protocol version.
// Selects the manifest hash layout and which hash peers trust.
namespace statesync::schema {

enum class state_sync_version : uint32_t {
  // Initial version.
  v0 = 0,
  // Version and chunk table are part of the manifest hash.
  v1 = 1,
  // Manifest hash is the meta-manifest hash over the encoded manifest.
  v2 = 2,
  // File hashes no longer include the file index.
  v3 = 3,
};

inline constexpr auto kStateSyncVersionMappings = std::array{
    std::pair<std::string_view, state_sync_version>{"V0",
                                                    state_sync_version::v0},
    std::pair<std::string_view, state_sync_version>{"V1",
                                                    state_sync_version::v1},
    std::pair<std::string_view, state_sync_version>{"V2",
                                                    state_sync_version::v2},
    std::pair<std::string_view, state_sync_version>{"V3",
                                                    state_sync_version::v3}};

/// Version used for every newly computed manifest.
inline constexpr auto kCurrentStateSyncVersion = state_sync_version::v2;

/// Manifests with a higher version are rejected on decode.
inline constexpr auto kMaxSupportedStateSyncVersion = state_sync_version::v3;

template <>
inline std::optional<state_sync_version> try_from_string<state_sync_version>(
    const std::string_view value) {
  return from_string(value, kStateSyncVersionMappings);
}

inline constexpr std::string_view to_string(const state_sync_version value) {
  return to_string(value, kStateSyncVersionMappings).value_or("unknown");
}

/// Map a wire integer to a known version no greater than the maximum
/// supported one.
inline constexpr std::optional<state_sync_version> try_make_state_sync_version(
    const uint32_t value) {
  auto version = from_underlying(value, kStateSyncVersionMappings);
  if (!version || *version > kMaxSupportedStateSyncVersion) {
    return std::nullopt;
  }
  return version;
}

inline constexpr uint32_t to_underlying(const state_sync_version value) {
  return static_cast<uint32_t>(value);
}

}  // namespace statesync::schema
