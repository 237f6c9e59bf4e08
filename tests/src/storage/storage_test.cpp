#include <statesync/manifest/builder.hpp>
#include <statesync/manifest/meta_manifest.hpp>
#include <statesync/schema/encoding/scale/manifest.hpp>
#include <statesync/storage/storage.hpp>
#include <statesync/storage/rocksdb/storage.hpp>
#include <statesync/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

using storage_t =
    statesync::storage::storage<statesync::storage::rocksdb_storage_tag>;

statesync::schema::manifest make_manifest(const uint8_t seed) {
  auto files = std::vector<statesync::schema::checkpoint_file>{
      statesync::testing::make_file("system_metadata.pbuf", 2000, seed),
      statesync::testing::make_file("canister_states/01/heap.bin", 10, seed)};
  return statesync::manifest::build_manifest(
      files, statesync::manifest::build_options{.chunk_size = 1024});
}

}  // namespace

TEST(storage, manifest_round_trips) {
  auto db = statesync::testing::make_db_path("statesync_storage_manifest");
  {
    auto storage =
        statesync::storage::make_storage<statesync::storage::rocksdb_storage_tag>(
            db);
    auto manifest = make_manifest(1);
    auto meta = statesync::manifest::build_meta_manifest(manifest, 64);
    storage.save_manifest(42, manifest, meta);

    auto loaded = storage.load_manifest(42);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, manifest);

    auto loaded_meta = storage.load_meta_manifest(42);
    ASSERT_TRUE(loaded_meta.has_value());
    EXPECT_EQ(*loaded_meta, meta);
  }
  statesync::testing::remove_path(db);
}

TEST(storage, missing_height_is_empty) {
  auto db = statesync::testing::make_db_path("statesync_storage_missing");
  {
    auto storage =
        statesync::storage::make_storage<statesync::storage::rocksdb_storage_tag>(
            db);
    EXPECT_FALSE(storage.load_manifest(7).has_value());
    EXPECT_FALSE(storage.load_meta_manifest(7).has_value());
    EXPECT_TRUE(storage.list_manifest_heights().empty());
  }
  statesync::testing::remove_path(db);
}

TEST(storage, heights_are_listed_in_ascending_order) {
  auto db = statesync::testing::make_db_path("statesync_storage_heights");
  {
    auto storage =
        statesync::storage::make_storage<statesync::storage::rocksdb_storage_tag>(
            db);
    for (auto height : {uint64_t{300}, uint64_t{2}, uint64_t{256},
                        uint64_t{1} << 40, uint64_t{1}}) {
      auto manifest = make_manifest(static_cast<uint8_t>(height));
      storage.save_manifest(height, manifest,
                            statesync::manifest::build_meta_manifest(manifest));
    }
    EXPECT_EQ(storage.list_manifest_heights(),
              (std::vector<uint64_t>{1, 2, 256, 300, uint64_t{1} << 40}));
  }
  statesync::testing::remove_path(db);
}

TEST(storage, saving_a_height_again_replaces_it) {
  auto db = statesync::testing::make_db_path("statesync_storage_replace");
  {
    auto storage =
        statesync::storage::make_storage<statesync::storage::rocksdb_storage_tag>(
            db);
    auto first = make_manifest(1);
    auto second = make_manifest(2);
    storage.save_manifest(5, first,
                          statesync::manifest::build_meta_manifest(first));
    storage.save_manifest(5, second,
                          statesync::manifest::build_meta_manifest(second));

    auto loaded = storage.load_manifest(5);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, second);
    EXPECT_EQ(storage.list_manifest_heights(), (std::vector<uint64_t>{5}));
  }
  statesync::testing::remove_path(db);
}

TEST(storage, data_survives_reopening) {
  auto db = statesync::testing::make_db_path("statesync_storage_reopen");
  auto manifest = make_manifest(3);
  {
    auto storage =
        statesync::storage::make_storage<statesync::storage::rocksdb_storage_tag>(
            db);
    storage.save_manifest(9, manifest,
                          statesync::manifest::build_meta_manifest(manifest));
  }
  {
    auto storage =
        statesync::storage::make_storage<statesync::storage::rocksdb_storage_tag>(
            db);
    auto loaded = storage.load_manifest(9);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, manifest);
  }
  statesync::testing::remove_path(db);
}

TEST(storage, malformed_stored_manifest_aborts_loading) {
  auto db = statesync::testing::make_db_path("statesync_storage_malformed");
  {
    auto storage =
        statesync::storage::make_storage<statesync::storage::rocksdb_storage_tag>(
            db);
    // Decodes fine, but its only chunk names a file slot that does not exist.
    auto malformed = statesync::schema::manifest{
        statesync::schema::state_sync_version::v2,
        {statesync::schema::file_info{.relative_path = "a", .size_bytes = 10}},
        {statesync::schema::chunk_info{
            .file_index = 5, .size_bytes = 10, .offset = 0}}};
    auto encoded = statesync::schema::encoding::encode_manifest(malformed);
    auto status = storage.database->Put(
        ROCKSDB_NAMESPACE::WriteOptions{},
        statesync::storage::detail::make_height_key(
            statesync::storage::detail::kManifestPrefix, 3),
        statesync::storage::detail::to_slice(encoded));
    ASSERT_TRUE(status.ok()) << status.ToString();
  }
  EXPECT_DEATH(
      {
        auto storage = statesync::storage::make_storage<
            statesync::storage::rocksdb_storage_tag>(db);
        static_cast<void>(storage.load_manifest(3));
      },
      "");
  statesync::testing::remove_path(db);
}

TEST(storage, height_keys_round_trip) {
  auto key = statesync::storage::detail::make_height_key(
      statesync::storage::detail::kManifestPrefix, 123456789);
  EXPECT_TRUE(key.starts_with(statesync::storage::detail::kManifestPrefix));
  EXPECT_EQ(statesync::storage::detail::parse_height_key(
                statesync::storage::detail::kManifestPrefix, key),
            uint64_t{123456789});
  EXPECT_FALSE(statesync::storage::detail::parse_height_key(
                   statesync::storage::detail::kMetaManifestPrefix, key)
                   .has_value());
}
