#pragma once
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/manifest_error.hpp>
#include <statesync/schema/meta_manifest.hpp>
#include <statesync/schema/primitives.hpp>
#include <optional>

// Wire encoding of manifests and meta-manifests.
//
// manifest      := version as u32 · vec<file_info> · vec<chunk_info>
// meta_manifest := version as u32 · vec<hash32>
//
// The version leads both values so it can be checked before anything else
// is interpreted.
namespace statesync::schema::encoding {

statesync::schema::bytes_t encode_manifest(
    const statesync::schema::manifest& value);

/// Decode a manifest; on failure `error` holds version_unsupported or
/// decode_failed with the codec's message.
std::optional<statesync::schema::manifest> decode_manifest(
    const statesync::schema::bytes_view_t& bytes,
    statesync::schema::manifest_error& error);

statesync::schema::bytes_t encode_meta_manifest(
    const statesync::schema::meta_manifest& value);

std::optional<statesync::schema::meta_manifest> decode_meta_manifest(
    const statesync::schema::bytes_view_t& bytes,
    statesync::schema::manifest_error& error);

}  // namespace statesync::schema::encoding
