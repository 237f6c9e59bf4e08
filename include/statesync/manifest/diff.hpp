#pragma once

#include <statesync/schema/file_group_chunks.hpp>
#include <statesync/schema/manifest.hpp>

#include <cstdint>
#include <map>
#include <vector>

namespace statesync::manifest {

struct manifest_diff final {
  // Chunk table index in the new manifest -> index of a chunk with the same
  // size and hash in the old manifest.
  std::map<uint32_t, uint32_t> copy_chunks;
  // Wire chunk ids that must be fetched, ascending.
  std::vector<uint32_t> fetch_chunk_ids;
};

/// Work needed to move from `old_manifest` to `new_manifest`: chunks that
/// already exist locally are copied, the rest is fetched.
manifest_diff diff_manifests(const statesync::schema::manifest& old_manifest,
                             const statesync::schema::manifest& new_manifest);

/// As above; a chunk that is a member of one of `groups` is fetched through
/// its group id, once per group.
manifest_diff diff_manifests(const statesync::schema::manifest& old_manifest,
                             const statesync::schema::manifest& new_manifest,
                             const statesync::schema::file_group_chunks& groups);

}  // namespace statesync::manifest
