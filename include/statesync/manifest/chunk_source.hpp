#pragma once

#include <statesync/manifest/chunk_id.hpp>
#include <statesync/manifest/chunk_reader.hpp>
#include <statesync/schema/file_group_chunks.hpp>
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/meta_manifest.hpp>
#include <statesync/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace statesync::manifest {

/// Resolves wire chunk ids of one checkpoint to the bytes a peer receives.
///
///   id 0                  encoded meta-manifest
///   [1, 2^30)             raw file chunk (chunk table index id - 1)
///   [2^30, 2^31)          concatenated members of a file group
///   [2^31, 2^32)          slice of the encoded manifest
///
/// Manifest slices are cut from a fresh encoding of the manifest on every
/// request; only the meta-manifest is kept.
class chunk_source final {
 public:
  chunk_source(statesync::schema::manifest value,
               statesync::schema::file_group_chunks groups,
               chunk_reader_t reader,
               uint32_t sub_manifest_size = kMaxSubManifestSize);

  /// Bytes of `chunk_id`, std::nullopt for ids this checkpoint does not
  /// have or when the reader cannot supply the range.
  std::optional<statesync::schema::bytes_t> get_chunk(uint32_t chunk_id) const;

  const statesync::schema::manifest& current_manifest() const {
    return manifest_;
  }
  const statesync::schema::meta_manifest& meta() const { return meta_; }
  const statesync::schema::file_group_chunks& groups() const {
    return groups_;
  }

 private:
  std::optional<statesync::schema::bytes_t> get_file_chunk(
      uint32_t chunk_table_index) const;
  std::optional<statesync::schema::bytes_t> get_manifest_chunk(
      uint32_t index) const;

  statesync::schema::manifest manifest_;
  statesync::schema::meta_manifest meta_;
  statesync::schema::file_group_chunks groups_;
  chunk_reader_t reader_;
  uint32_t sub_manifest_size_{kMaxSubManifestSize};
};

}  // namespace statesync::manifest
