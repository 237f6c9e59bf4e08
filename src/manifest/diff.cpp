#include <spdlog/spdlog.h>
#include <statesync/manifest/chunk_id.hpp>
#include <statesync/manifest/diff.hpp>

#include <algorithm>
#include <set>
#include <utility>

namespace statesync::manifest {

manifest_diff diff_manifests(const schema::manifest& old_manifest,
                             const schema::manifest& new_manifest) {
  return diff_manifests(old_manifest, new_manifest,
                        schema::file_group_chunks{});
}

manifest_diff diff_manifests(const schema::manifest& old_manifest,
                             const schema::manifest& new_manifest,
                             const schema::file_group_chunks& groups) {
  auto known = std::map<std::pair<schema::hash32_t, uint32_t>, uint32_t>{};
  for (uint32_t i = 0; i < old_manifest->chunk_table.size(); ++i) {
    const auto& chunk = old_manifest->chunk_table[i];
    known.try_emplace({chunk.hash, chunk.size_bytes}, i);
  }

  auto group_of = std::map<uint32_t, uint32_t>{};
  for (const auto& [chunk_id, indices] : groups) {
    for (auto index : indices) {
      group_of.emplace(index, chunk_id);
    }
  }

  auto diff = manifest_diff{};
  auto fetch = std::set<uint32_t>{};
  for (uint32_t i = 0; i < new_manifest->chunk_table.size(); ++i) {
    const auto& chunk = new_manifest->chunk_table[i];
    auto found = known.find({chunk.hash, chunk.size_bytes});
    if (found != std::end(known)) {
      diff.copy_chunks.emplace(i, found->second);
      continue;
    }
    auto group = group_of.find(i);
    fetch.insert(group == std::end(group_of) ? file_chunk_id(i)
                                             : group->second);
  }
  diff.fetch_chunk_ids.assign(std::begin(fetch), std::end(fetch));

  spdlog::debug("Manifest diff: {} chunk(s) copied, {} chunk id(s) fetched",
                diff.copy_chunks.size(), diff.fetch_chunk_ids.size());
  return diff;
}

}  // namespace statesync::manifest
