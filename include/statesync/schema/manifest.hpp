#pragma once

#include <statesync/schema/chunk_info.hpp>
#include <statesync/schema/file_info.hpp>
#include <statesync/schema/state_sync_version.hpp>

#include <memory>
#include <vector>

// Schema type: manifest.
// Describes a checkpoint as two tables: files and the chunks they are split
// into. Chunk ids on the wire are chunk table indices plus one, so table
// order is part of the protocol.
//
//   -- FILES
//   [0]: ("system_metadata.pbuf", 1500, <hash>)
//   [1]: ("canister_states/00..11/software.wasm", 93000, <hash>)
//   -- CHUNKS
//   [0]: (0, 1500, 0, <hash>)
//   [1]: (1, 93000, 0, <hash>)
namespace statesync::schema {

struct manifest_data final {
  state_sync_version version{kCurrentStateSyncVersion};
  std::vector<file_info> file_table;
  std::vector<chunk_info> chunk_table;

  bool operator==(const manifest_data&) const = default;
};

/// Immutable, cheaply copyable handle to manifest data.
///
/// Copies share one allocation; the data is never mutated after
/// construction, so copies may be read from any thread without locking.
class manifest final {
 public:
  manifest(state_sync_version version,
           std::vector<file_info> file_table,
           std::vector<chunk_info> chunk_table);

  const manifest_data& operator*() const { return *data_; }
  const manifest_data* operator->() const { return data_.get(); }

  bool operator==(const manifest& other) const {
    return data_ == other.data_ || *data_ == *other.data_;
  }

 private:
  std::shared_ptr<const manifest_data> data_;
};

}  // namespace statesync::schema
