#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <statesync/common/critical.hpp>
#include <statesync/manifest/validate.hpp>
#include <statesync/schema/encoding/scale/encoder.hpp>
#include <statesync/schema/encoding/scale/manifest.hpp>
#include <statesync/storage/storage.hpp>
#include <algorithm>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string>
#include <string_view>

namespace statesync::storage {

namespace detail {

using encoder_t = statesync::schema::encoding::encoder<
    statesync::schema::encoding::scale_encoder_tag>;

inline constexpr auto kManifestPrefix = std::string_view{"SYS|SYNC|MANIFEST|"};
inline constexpr auto kMetaManifestPrefix = std::string_view{"SYS|SYNC|META|"};

inline std::string make_height_key(std::string_view prefix, uint64_t height) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(height);
  auto key = std::string{prefix};
  key.append(reinterpret_cast<const char*>(encoded.data()), encoded.size());
  return key;
}

inline std::optional<uint64_t> parse_height_key(std::string_view prefix,
                                                std::string_view key) {
  if (!key.starts_with(prefix)) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto bytes = statesync::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(key.data() + prefix.size()),
      key.size() - prefix.size()};
  return encoder.try_decode<uint64_t>(bytes);
}

inline statesync::schema::bytes_view_t to_bytes_view(const std::string& raw) {
  return statesync::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(raw.data()), raw.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const statesync::schema::bytes_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  void save_manifest(uint64_t height,
                     const statesync::schema::manifest& manifest,
                     const statesync::schema::meta_manifest& meta) const;
  std::optional<statesync::schema::manifest> load_manifest(
      uint64_t height) const;
  std::optional<statesync::schema::meta_manifest> load_meta_manifest(
      uint64_t height) const;
  std::vector<uint64_t> list_manifest_heights() const;

 private:
  std::optional<std::string> get_raw(const std::string& key) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<std::string> storage<rocksdb_storage_tag>::get_raw(
    const std::string& key) const {
  if (!database) {
    statesync::common::critical("manifest store is not open");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, key, &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to read from manifest store: {}", status.ToString());
    statesync::common::critical("failed to read from manifest store");
  }
  return value;
}

inline void storage<rocksdb_storage_tag>::save_manifest(
    uint64_t height,
    const statesync::schema::manifest& manifest,
    const statesync::schema::meta_manifest& meta) const {
  if (!database) {
    statesync::common::critical("manifest store is not open");
  }
  auto encoded_manifest = statesync::schema::encoding::encode_manifest(manifest);
  auto encoded_meta = statesync::schema::encoding::encode_meta_manifest(meta);

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  auto manifest_status =
      batch.Put(detail::make_height_key(detail::kManifestPrefix, height),
                detail::to_slice(encoded_manifest));
  auto meta_status =
      batch.Put(detail::make_height_key(detail::kMetaManifestPrefix, height),
                detail::to_slice(encoded_meta));
  if (!manifest_status.ok() || !meta_status.ok()) {
    statesync::common::critical("failed to stage manifest for height");
  }

  auto write_status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to persist manifest at height {}: {}", height,
                  write_status.ToString());
    statesync::common::critical("failed to persist manifest");
  }
  spdlog::info("Persisted {} manifest at height {} ({} sub-manifest(s))",
               statesync::schema::to_string(manifest->version), height,
               meta.sub_manifest_hashes.size());
}

inline std::optional<statesync::schema::manifest>
storage<rocksdb_storage_tag>::load_manifest(uint64_t height) const {
  auto raw =
      get_raw(detail::make_height_key(detail::kManifestPrefix, height));
  if (!raw) {
    return std::nullopt;
  }
  auto error = statesync::schema::manifest_error{};
  auto decoded = statesync::schema::encoding::decode_manifest(
      detail::to_bytes_view(*raw), error);
  if (!decoded) {
    spdlog::error("Stored manifest at height {} is unreadable: {}", height,
                  error.message);
    statesync::common::critical("failed to decode stored manifest");
  }
  if (!statesync::manifest::validate_manifest_structure(*decoded, error)) {
    spdlog::error("Stored manifest at height {} is malformed: {}", height,
                  error.message);
    statesync::common::critical("stored manifest has an invalid structure");
  }
  return decoded;
}

inline std::optional<statesync::schema::meta_manifest>
storage<rocksdb_storage_tag>::load_meta_manifest(uint64_t height) const {
  auto raw =
      get_raw(detail::make_height_key(detail::kMetaManifestPrefix, height));
  if (!raw) {
    return std::nullopt;
  }
  auto error = statesync::schema::manifest_error{};
  auto decoded = statesync::schema::encoding::decode_meta_manifest(
      detail::to_bytes_view(*raw), error);
  if (!decoded) {
    spdlog::error("Stored meta-manifest at height {} is unreadable: {}",
                  height, error.message);
    statesync::common::critical("failed to decode stored meta-manifest");
  }
  return decoded;
}

inline std::vector<uint64_t>
storage<rocksdb_storage_tag>::list_manifest_heights() const {
  if (!database) {
    statesync::common::critical("manifest store is not open");
  }
  auto heights = std::vector<uint64_t>{};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(std::string{detail::kManifestPrefix});
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(detail::kManifestPrefix)) {
      break;
    }
    auto height = detail::parse_height_key(detail::kManifestPrefix, key_view);
    if (!height) {
      spdlog::warn("Skipping malformed manifest key of {} bytes",
                   key_view.size());
      iterator->Next();
      continue;
    }
    heights.push_back(*height);
    iterator->Next();
  }

  // Keys embed SCALE (little-endian) heights, so key order is not height
  // order.
  std::ranges::sort(heights);
  return heights;
}

}  // namespace statesync::storage
