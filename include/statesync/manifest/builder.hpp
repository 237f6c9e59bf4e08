#pragma once

#include <statesync/manifest/chunk_id.hpp>
#include <statesync/schema/checkpoint_file.hpp>
#include <statesync/schema/chunk_info.hpp>
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/state_sync_version.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace statesync::manifest {

struct build_options final {
  statesync::schema::state_sync_version version{
      statesync::schema::kCurrentStateSyncVersion};
  uint32_t chunk_size{kDefaultChunkSize};
  // Files are hashed on this many threads; 1 hashes on the calling thread.
  std::size_t thread_count{1};
};

/// Split one file into chunk table entries of at most `chunk_size` bytes.
/// An empty file has no chunks.
std::vector<statesync::schema::chunk_info> compute_file_chunks(
    uint32_t file_index,
    const statesync::schema::bytes_view_t& content,
    uint32_t chunk_size);

/// Compute the manifest of a checkpoint.
///
/// Files keep the order in which they are given; the chunks of each file
/// follow in offset order. The result does not depend on `thread_count`.
statesync::schema::manifest build_manifest(
    const std::vector<statesync::schema::checkpoint_file>& files,
    const build_options& options = {});

}  // namespace statesync::manifest
