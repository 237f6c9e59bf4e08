#include <gtest/gtest.h>
#include <statesync/manifest/builder.hpp>
#include <statesync/manifest/chunk_source.hpp>
#include <statesync/manifest/file_group.hpp>
#include <statesync/manifest/hash.hpp>
#include <statesync/manifest/meta_manifest.hpp>
#include <statesync/manifest/validate.hpp>
#include <statesync/schema/encoding/scale/manifest.hpp>
#include <statesync/testing/common.hpp>

using statesync::manifest::chunk_source;
using statesync::manifest::file_chunk_id;
using statesync::manifest::manifest_chunk_id;
using statesync::testing::make_file;

TEST(chunk_source, serves_every_chunk_of_a_small_checkpoint) {
  auto files = std::vector<statesync::schema::checkpoint_file>{
      make_file("a", 1, 1), make_file("b", 1'500'000, 2)};
  auto manifest = statesync::manifest::build_manifest(files);
  auto source = chunk_source{manifest, statesync::schema::file_group_chunks{},
                             statesync::testing::make_memory_chunk_reader(files)};

  auto meta_bytes = source.get_chunk(statesync::manifest::kMetaManifestChunk);
  ASSERT_TRUE(meta_bytes.has_value());
  auto error = statesync::schema::manifest_error{};
  auto meta = statesync::schema::encoding::decode_meta_manifest(
      statesync::schema::make_bytes_view(*meta_bytes), error);
  ASSERT_TRUE(meta.has_value()) << error.message;
  EXPECT_EQ(*meta, source.meta());
  EXPECT_EQ(statesync::manifest::meta_manifest_hash(*meta),
            statesync::manifest::manifest_hash(manifest));

  auto expected_sizes = std::vector<std::size_t>{1, 1'048'576, 451'424};
  for (uint32_t index = 0; index < expected_sizes.size(); ++index) {
    auto bytes = source.get_chunk(file_chunk_id(index));
    ASSERT_TRUE(bytes.has_value()) << index;
    EXPECT_EQ(bytes->size(), expected_sizes[index]);
    EXPECT_TRUE(statesync::manifest::validate_chunk(
        manifest, index, statesync::schema::make_bytes_view(*bytes), error))
        << error.message;
  }
  EXPECT_FALSE(source.get_chunk(file_chunk_id(3)).has_value());
}

TEST(chunk_source, manifest_chunks_reassemble_the_encoding) {
  auto files = std::vector<statesync::schema::checkpoint_file>{};
  for (uint8_t i = 0; i < 8; ++i) {
    files.push_back(make_file("f" + std::to_string(i), 300, i));
  }
  auto manifest = statesync::manifest::build_manifest(
      files, statesync::manifest::build_options{.chunk_size = 128});
  auto source =
      chunk_source{manifest, statesync::schema::file_group_chunks{},
                   statesync::testing::make_memory_chunk_reader(files), 100};

  auto count = source.meta().sub_manifest_hashes.size();
  ASSERT_GT(count, 1u);
  auto encoded = statesync::schema::bytes_t{};
  for (uint32_t index = 0; index < count; ++index) {
    auto piece = source.get_chunk(manifest_chunk_id(index));
    ASSERT_TRUE(piece.has_value()) << index;
    EXPECT_LE(piece->size(), 100u);
    encoded.insert(std::end(encoded), std::begin(*piece), std::end(*piece));
  }
  EXPECT_EQ(encoded, statesync::schema::encoding::encode_manifest(manifest));
  EXPECT_FALSE(source.get_chunk(manifest_chunk_id(
                                    static_cast<uint32_t>(count)))
                   .has_value());
}

TEST(chunk_source, file_group_chunks_concatenate_members) {
  auto files = std::vector<statesync::schema::checkpoint_file>{
      make_file("small_1", 10, 1), make_file("large", 4000, 2),
      make_file("small_2", 20, 3)};
  auto manifest = statesync::manifest::build_manifest(
      files, statesync::manifest::build_options{.chunk_size = 1024});
  auto groups = statesync::manifest::build_file_group_chunks(manifest);
  ASSERT_EQ(groups.size(), 1u);

  auto source = chunk_source{manifest, groups,
                             statesync::testing::make_memory_chunk_reader(files)};
  auto group_id = statesync::manifest::kFileGroupChunkIdOffset;
  auto payload = source.get_chunk(group_id);
  ASSERT_TRUE(payload.has_value());

  auto expected = files[0].content;
  expected.insert(std::end(expected), std::begin(files[2].content),
                  std::end(files[2].content));
  EXPECT_EQ(*payload, expected);
  EXPECT_FALSE(source.get_chunk(group_id + 1).has_value());
}

TEST(chunk_source, unreadable_file_yields_no_chunk) {
  auto files = std::vector<statesync::schema::checkpoint_file>{
      make_file("present", 10, 1), make_file("absent", 10, 2)};
  auto manifest = statesync::manifest::build_manifest(files);
  auto source = chunk_source{
      manifest, statesync::schema::file_group_chunks{},
      statesync::testing::make_memory_chunk_reader({files[0]})};
  EXPECT_TRUE(source.get_chunk(file_chunk_id(0)).has_value());
  EXPECT_FALSE(source.get_chunk(file_chunk_id(1)).has_value());
}

TEST(chunk_source, chunk_naming_a_missing_file_is_not_served) {
  auto files = std::vector<statesync::schema::checkpoint_file>{
      make_file("a", 10, 1)};
  auto manifest = statesync::schema::manifest{
      statesync::schema::state_sync_version::v2,
      {statesync::schema::file_info{.relative_path = "a", .size_bytes = 10}},
      {statesync::schema::chunk_info{
          .file_index = 5, .size_bytes = 10, .offset = 0}}};
  auto source =
      chunk_source{manifest,
                   statesync::testing::make_groups(
                       {{statesync::manifest::kFileGroupChunkIdOffset, {0}}}),
                   statesync::testing::make_memory_chunk_reader(files)};
  EXPECT_FALSE(source.get_chunk(file_chunk_id(0)).has_value());
  EXPECT_FALSE(
      source.get_chunk(statesync::manifest::kFileGroupChunkIdOffset)
          .has_value());
}
