#include <statesync/schema/file_group_chunks.hpp>

namespace statesync::schema {

std::vector<file_group_chunks::chunk_id_t> file_group_chunks::keys() const {
  auto out = std::vector<chunk_id_t>{};
  out.reserve(groups_.size());
  for (const auto& [chunk_id, indices] : groups_) {
    out.push_back(chunk_id);
  }
  return out;
}

const std::vector<file_group_chunks::chunk_table_index_t>*
file_group_chunks::find(const chunk_id_t chunk_id) const {
  auto it = groups_.find(chunk_id);
  if (it == std::end(groups_)) {
    return nullptr;
  }
  return &it->second;
}

std::optional<file_group_chunks::chunk_id_t> file_group_chunks::last_chunk_id()
    const {
  if (groups_.empty()) {
    return std::nullopt;
  }
  return groups_.rbegin()->first;
}

}  // namespace statesync::schema
