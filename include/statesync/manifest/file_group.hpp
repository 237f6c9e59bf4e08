#pragma once

#include <statesync/manifest/chunk_id.hpp>
#include <statesync/manifest/chunk_reader.hpp>
#include <statesync/schema/file_group_chunks.hpp>
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/manifest_error.hpp>
#include <statesync/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace statesync::manifest {

/// Which files are bundled into file group chunks.
struct file_group_options final {
  // Only files of a single chunk no larger than this are grouped.
  uint64_t max_file_size_bytes{1u << 13};
  // Upper bound of the summed payload of one group.
  uint32_t max_group_bytes{kDefaultChunkSize};
  // Only paths ending with this suffix are grouped; empty matches all.
  std::string path_suffix;
};

/// Bundle small files of `value` into groups with consecutive ids starting
/// at kFileGroupChunkIdOffset. Files are visited in file table order.
statesync::schema::file_group_chunks build_file_group_chunks(
    const statesync::schema::manifest& value,
    const file_group_options& options = {});

/// Payload of a file group chunk: the member chunks concatenated in order.
std::optional<statesync::schema::bytes_t> assemble_file_group_chunk(
    const statesync::schema::manifest& value,
    const std::vector<uint32_t>& chunk_table_indices,
    const chunk_reader_t& reader);

/// Cut a received file group payload back into its member chunks, checking
/// the total size and every member's hash.
std::optional<std::vector<statesync::schema::bytes_t>> split_file_group_chunk(
    const statesync::schema::manifest& value,
    const std::vector<uint32_t>& chunk_table_indices,
    const statesync::schema::bytes_view_t& payload,
    statesync::schema::manifest_error& error);

}  // namespace statesync::manifest
