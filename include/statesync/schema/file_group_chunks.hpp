#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

// Schema type: file group chunks.
// Maps a synthetic wire chunk id to the chunk table indices it bundles.
namespace statesync::schema {

class file_group_chunks final {
 public:
  using chunk_id_t = uint32_t;
  using chunk_table_index_t = uint32_t;
  using map_t = std::map<chunk_id_t, std::vector<chunk_table_index_t>>;
  using const_iterator = map_t::const_iterator;

  file_group_chunks() = default;
  explicit file_group_chunks(map_t groups) : groups_(std::move(groups)) {}

  std::size_t size() const { return groups_.size(); }
  bool empty() const { return groups_.empty(); }

  /// Group ids in ascending order.
  std::vector<chunk_id_t> keys() const;

  const_iterator begin() const { return groups_.begin(); }
  const_iterator end() const { return groups_.end(); }

  /// Chunk table indices bundled under `chunk_id`, or nullptr.
  const std::vector<chunk_table_index_t>* find(chunk_id_t chunk_id) const;

  /// Largest assigned group id, std::nullopt when there are no groups.
  std::optional<chunk_id_t> last_chunk_id() const;

  bool operator==(const file_group_chunks&) const = default;

 private:
  map_t groups_;
};

}  // namespace statesync::schema
