#include <statesync/common/critical.hpp>
#include <statesync/storage/rocksdb/storage.hpp>

namespace statesync::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  // One manifest and one meta-manifest per checkpoint height: few keys,
  // large values made mostly of hashes, which do not compress.
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.OptimizeForSmallDb();
  options.compression = ROCKSDB_NAMESPACE::kNoCompression;

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open manifest store at {}: {}", path,
                  status.ToString());
    statesync::common::critical("failed to open manifest store");
  }
  store.database.reset(database);

  spdlog::info("Opened manifest store at {} ({} height(s) stored)", path,
               store.list_manifest_heights().size());
  return store;
}
}  // namespace statesync::storage
