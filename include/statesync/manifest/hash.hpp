#pragma once

#include <statesync/manifest/chunk_id.hpp>
#include <statesync/schema/chunk_info.hpp>
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/meta_manifest.hpp>
#include <statesync/schema/primitives.hpp>
#include <statesync/schema/state_sync_version.hpp>

#include <cstdint>
#include <span>
#include <string_view>

// Manifest hash rules.
//
// dsep(tag) = byte(len(tag)) · tag. Integers are big-endian with full width;
// every variable-size value (path, table) is prefixed with its length so two
// different tables can never serialize to the same byte string.
//
//   chunk_hash    := H(dsep("ic-state-chunk") · content)
//   file_hash     := H(dsep("ic-state-file") · len(slice) as u32 · chunk_entry*)
//   chunk_entry   := [file_index as u32, before V3] · size_bytes as u32
//                    · offset as u64 · chunk_hash
//   V0 manifest   := H(dsep("ic-state-manifest") · len(files) as u32
//                    · file_entry*)
//   V1 manifest   := H(dsep("ic-state-manifest") · version as u32
//                    · len(files) as u32 · file_entry*
//                    · len(chunks) as u32 · chunk_entry_with_index*)
//   file_entry    := len(path) as u32 · path · size_bytes as u64 · file_hash
//   sub_manifest  := H(dsep("ic-state-sub-manifest") · piece)
//   meta_manifest := H(dsep("ic-state-meta-manifest") · version as u32
//                    · len(sub_hashes) as u32 · sub_hash*)
//
// From V2 on, the trusted manifest hash is the meta-manifest hash.
namespace statesync::manifest {

inline constexpr auto kChunkDomain = std::string_view{"ic-state-chunk"};
inline constexpr auto kFileDomain = std::string_view{"ic-state-file"};
inline constexpr auto kManifestDomain = std::string_view{"ic-state-manifest"};
inline constexpr auto kSubManifestDomain =
    std::string_view{"ic-state-sub-manifest"};
inline constexpr auto kMetaManifestDomain =
    std::string_view{"ic-state-meta-manifest"};

statesync::schema::hash32_t chunk_hash(
    const statesync::schema::bytes_view_t& content);

/// Hash of a file from its slice of the chunk table.
statesync::schema::hash32_t file_hash(
    statesync::schema::state_sync_version version,
    std::span<const statesync::schema::chunk_info> chunks);

/// Table hash used as the manifest hash by V0 and V1.
///
/// Still computable for later versions, where it is not trusted.
statesync::schema::hash32_t legacy_manifest_hash(
    const statesync::schema::manifest& value);

statesync::schema::hash32_t sub_manifest_hash(
    const statesync::schema::bytes_view_t& piece);

statesync::schema::hash32_t meta_manifest_hash(
    const statesync::schema::meta_manifest& value);

/// The hash peers agree on for this manifest: the table hash for V0 and V1,
/// the meta-manifest hash of the encoded manifest afterwards.
statesync::schema::hash32_t manifest_hash(
    const statesync::schema::manifest& value,
    uint32_t sub_manifest_size = kMaxSubManifestSize);

}  // namespace statesync::manifest
