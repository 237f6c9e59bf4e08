#pragma once

#include <statesync/manifest/chunk_id.hpp>
#include <statesync/schema/file_group_chunks.hpp>
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/manifest_error.hpp>
#include <statesync/schema/meta_manifest.hpp>
#include <statesync/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace statesync::manifest {

/// Check the table invariants: every file_index names a file, the chunks of
/// a file are contiguous in the chunk table and in file order, and their
/// offsets tile [0, size_bytes) with non-empty chunks.
bool validate_manifest_structure(const statesync::schema::manifest& value,
                                 statesync::schema::manifest_error& error);

/// Structure, every file hash recomputed from the chunk table, then the
/// manifest hash against `expected_hash`. From V2 on the manifest hash depends
/// on the sub-manifest size the encoded manifest was split with.
bool validate_manifest(const statesync::schema::manifest& value,
                       const statesync::schema::hash32_t& expected_hash,
                       statesync::schema::manifest_error& error,
                       uint32_t sub_manifest_size = kMaxSubManifestSize);

/// Check one file chunk against its chunk table entry.
bool validate_chunk(const statesync::schema::manifest& value,
                    uint32_t chunk_table_index,
                    const statesync::schema::bytes_view_t& content,
                    statesync::schema::manifest_error& error);

/// Check one received sub-manifest against its recorded hash.
bool validate_sub_manifest(const statesync::schema::meta_manifest& meta,
                           uint32_t index,
                           const statesync::schema::bytes_view_t& piece,
                           statesync::schema::manifest_error& error);

bool validate_meta_manifest(const statesync::schema::meta_manifest& meta,
                            const statesync::schema::hash32_t& expected_hash,
                            statesync::schema::manifest_error& error);

/// Every group id lies in the file group range, every referenced chunk
/// index is in range and no index belongs to two groups.
bool validate_file_group_chunks(const statesync::schema::manifest& value,
                                const statesync::schema::file_group_chunks& groups,
                                statesync::schema::manifest_error& error);

/// [begin, end) chunk table range of every file. Requires a structurally
/// valid manifest.
std::vector<std::pair<std::size_t, std::size_t>> file_chunk_ranges(
    const statesync::schema::manifest& value);

}  // namespace statesync::manifest
