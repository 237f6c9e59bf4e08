#pragma once

#include <statesync/manifest/chunk_id.hpp>
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/meta_manifest.hpp>
#include <statesync/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace statesync::manifest {

/// Split already encoded manifest bytes into pieces of at most
/// `sub_manifest_size` bytes and hash each piece.
statesync::schema::meta_manifest build_meta_manifest(
    statesync::schema::state_sync_version version,
    const statesync::schema::bytes_view_t& encoded_manifest,
    uint32_t sub_manifest_size = kMaxSubManifestSize);

/// Encode `value` and build its meta-manifest.
statesync::schema::meta_manifest build_meta_manifest(
    const statesync::schema::manifest& value,
    uint32_t sub_manifest_size = kMaxSubManifestSize);

/// Number of sub-manifests an encoded manifest of `encoded_size` bytes is
/// split into.
uint32_t sub_manifest_count(uint64_t encoded_size,
                            uint32_t sub_manifest_size = kMaxSubManifestSize);

/// Piece `index` of the encoded manifest, std::nullopt when out of range.
std::optional<statesync::schema::bytes_view_t> sub_manifest_piece(
    const statesync::schema::bytes_view_t& encoded_manifest,
    uint32_t index,
    uint32_t sub_manifest_size = kMaxSubManifestSize);

}  // namespace statesync::manifest
