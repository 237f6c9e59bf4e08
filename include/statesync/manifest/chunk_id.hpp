#pragma once

#include <statesync/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace statesync::manifest {

/// Default size of a file chunk when computing a manifest.
inline constexpr uint32_t kDefaultChunkSize = 1u << 20;

/// Default size of one sub-manifest piece of an encoded manifest. Defined
/// separately from kDefaultChunkSize; the two only happen to be equal.
inline constexpr uint32_t kMaxSubManifestSize = 1u << 20;

/// Chunk id of the meta-manifest.
inline constexpr uint32_t kMetaManifestChunk = 0;

/// File chunk ids are chunk table indices plus this offset.
inline constexpr uint32_t kFileChunkIdOffset = 1;

/// First id of the file group range.
///
/// A chunk table stays far below 2^30 entries: even 10 * 2^20 canisters with
/// fewer than 10 files each plus 100 TiB of state (about 2^20 chunks per TiB)
/// is below 210 million chunks.
inline constexpr uint32_t kFileGroupChunkIdOffset = 1u << 30;

/// First id of the manifest chunk range.
///
/// Every file group bundles several chunk table entries, so there are fewer
/// groups than chunks, leaving [2^30, 2^31) more than wide enough.
inline constexpr uint32_t kManifestChunkIdOffset = 1u << 31;

static_assert(kManifestChunkIdOffset > kFileGroupChunkIdOffset,
              "manifest chunk ids must start above the file group range");
static_assert(kFileGroupChunkIdOffset > kFileChunkIdOffset);

enum class chunk_kind : uint8_t {
  meta_manifest = 0,
  file = 1,
  file_group = 2,
  manifest = 3,
};

inline constexpr auto kChunkKindMappings = std::array{
    std::pair<std::string_view, chunk_kind>{"meta_manifest",
                                            chunk_kind::meta_manifest},
    std::pair<std::string_view, chunk_kind>{"file", chunk_kind::file},
    std::pair<std::string_view, chunk_kind>{"file_group",
                                            chunk_kind::file_group},
    std::pair<std::string_view, chunk_kind>{"manifest", chunk_kind::manifest}};

inline constexpr std::string_view to_string(const chunk_kind value) {
  return statesync::schema::to_string(value, kChunkKindMappings)
      .value_or("unknown");
}

/// Kind of a wire chunk and its index within that kind.
///
/// For file chunks `index` is the chunk table index, for manifest chunks the
/// sub-manifest index. File group chunks keep the full id because it is the
/// key into file_group_chunks rather than a position.
struct state_sync_chunk final {
  chunk_kind kind{chunk_kind::meta_manifest};
  uint32_t index{};

  constexpr bool operator==(const state_sync_chunk&) const = default;
};

/// Classify a chunk id. Total over uint32_t.
constexpr state_sync_chunk classify_chunk(const uint32_t chunk_id) {
  if (chunk_id == kMetaManifestChunk) {
    return {chunk_kind::meta_manifest, 0};
  }
  if (chunk_id < kFileGroupChunkIdOffset) {
    return {chunk_kind::file, chunk_id - kFileChunkIdOffset};
  }
  if (chunk_id < kManifestChunkIdOffset) {
    return {chunk_kind::file_group, chunk_id};
  }
  return {chunk_kind::manifest, chunk_id - kManifestChunkIdOffset};
}

constexpr uint32_t file_chunk_id(const uint32_t chunk_table_index) {
  return chunk_table_index + kFileChunkIdOffset;
}

constexpr uint32_t manifest_chunk_id(const uint32_t sub_manifest_index) {
  return sub_manifest_index + kManifestChunkIdOffset;
}

}  // namespace statesync::manifest
