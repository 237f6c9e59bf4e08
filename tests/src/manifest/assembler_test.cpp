#include <gtest/gtest.h>
#include <statesync/manifest/assembler.hpp>
#include <statesync/manifest/builder.hpp>
#include <statesync/manifest/chunk_source.hpp>
#include <statesync/manifest/hash.hpp>
#include <statesync/testing/common.hpp>

using statesync::manifest::chunk_source;
using statesync::manifest::manifest_assembler;
using statesync::manifest::manifest_chunk_id;
using statesync::schema::manifest_error;
using statesync::schema::manifest_error_code;
using statesync::schema::state_sync_version;

namespace {

constexpr auto kPieceSize = uint32_t{128};

struct served_checkpoint final {
  std::vector<statesync::schema::checkpoint_file> files;
  statesync::schema::manifest manifest;
  chunk_source source;
};

served_checkpoint serve(const state_sync_version version) {
  auto files = std::vector<statesync::schema::checkpoint_file>{};
  for (uint8_t i = 0; i < 10; ++i) {
    files.push_back(statesync::testing::make_file(
        "canister_states/" + std::to_string(i) + "/heap.bin", 500, i));
  }
  auto manifest = statesync::manifest::build_manifest(
      files, statesync::manifest::build_options{.version = version,
                                                .chunk_size = 256});
  auto source =
      chunk_source{manifest, statesync::schema::file_group_chunks{},
                   statesync::testing::make_memory_chunk_reader(files),
                   kPieceSize};
  return served_checkpoint{std::move(files), manifest, std::move(source)};
}

statesync::schema::hash32_t trusted_hash(const served_checkpoint& served) {
  return statesync::manifest::manifest_hash(served.manifest, kPieceSize);
}

statesync::schema::bytes_t fetch(const served_checkpoint& served,
                                 const uint32_t chunk_id) {
  auto bytes = served.source.get_chunk(chunk_id);
  EXPECT_TRUE(bytes.has_value()) << chunk_id;
  return bytes.value_or(statesync::schema::bytes_t{});
}

}  // namespace

TEST(assembler, accepts_a_full_set_for_every_version) {
  for (const auto& [name, version] :
       statesync::schema::kStateSyncVersionMappings) {
    auto served = serve(version);
    auto assembler = manifest_assembler{trusted_hash(served)};
    auto error = manifest_error{};

    EXPECT_FALSE(assembler.has_meta_manifest());
    EXPECT_TRUE(assembler.missing_manifest_chunks().empty());
    ASSERT_TRUE(assembler.add_meta_manifest(
        fetch(served, statesync::manifest::kMetaManifestChunk), error))
        << name << ": " << error.message;

    auto missing = assembler.missing_manifest_chunks();
    ASSERT_GT(missing.size(), 1u) << name;
    EXPECT_EQ(missing.front(), manifest_chunk_id(0));
    // Arrival order does not matter.
    for (auto it = std::rbegin(missing); it != std::rend(missing); ++it) {
      ASSERT_TRUE(assembler.add_manifest_chunk(*it, fetch(served, *it), error))
          << name << ": " << error.message;
    }
    EXPECT_TRUE(assembler.complete());
    EXPECT_TRUE(assembler.missing_manifest_chunks().empty());

    auto assembled = assembler.finish(error);
    ASSERT_TRUE(assembled.has_value()) << name << ": " << error.message;
    EXPECT_EQ(*assembled, served.manifest);
  }
}

TEST(assembler, rejects_meta_manifest_with_untrusted_hash) {
  auto served = serve(state_sync_version::v2);
  auto assembler = manifest_assembler{statesync::testing::make_hash(1)};
  auto error = manifest_error{};
  EXPECT_FALSE(assembler.add_meta_manifest(
      fetch(served, statesync::manifest::kMetaManifestChunk), error));
  EXPECT_EQ(error.code, manifest_error_code::hash_mismatch);
  EXPECT_FALSE(assembler.has_meta_manifest());
}

TEST(assembler, corrupted_piece_keeps_verified_siblings) {
  auto served = serve(state_sync_version::v2);
  auto assembler = manifest_assembler{trusted_hash(served)};
  auto error = manifest_error{};
  ASSERT_TRUE(assembler.add_meta_manifest(
      fetch(served, statesync::manifest::kMetaManifestChunk), error));

  auto ids = assembler.missing_manifest_chunks();
  ASSERT_GE(ids.size(), 3u);
  ASSERT_TRUE(assembler.add_manifest_chunk(ids[0], fetch(served, ids[0]), error));

  auto corrupted = fetch(served, ids[1]);
  corrupted[0] ^= 0x80;
  EXPECT_FALSE(assembler.add_manifest_chunk(ids[1], corrupted, error));
  EXPECT_EQ(error.code, manifest_error_code::hash_mismatch);

  auto missing = assembler.missing_manifest_chunks();
  EXPECT_EQ(missing.size(), ids.size() - 1);
  EXPECT_EQ(missing.front(), ids[1]);

  for (auto id : missing) {
    ASSERT_TRUE(assembler.add_manifest_chunk(id, fetch(served, id), error))
        << error.message;
  }
  auto assembled = assembler.finish(error);
  ASSERT_TRUE(assembled.has_value()) << error.message;
  EXPECT_EQ(*assembled, served.manifest);
}

TEST(assembler, refuses_to_finish_early) {
  auto served = serve(state_sync_version::v3);
  auto assembler = manifest_assembler{trusted_hash(served)};
  auto error = manifest_error{};
  EXPECT_FALSE(assembler.finish(error).has_value());
  EXPECT_EQ(error.code, manifest_error_code::invalid_structure);

  ASSERT_TRUE(assembler.add_meta_manifest(
      fetch(served, statesync::manifest::kMetaManifestChunk), error));
  auto ids = assembler.missing_manifest_chunks();
  ASSERT_TRUE(assembler.add_manifest_chunk(ids[0], fetch(served, ids[0]), error));
  EXPECT_FALSE(assembler.complete());
  EXPECT_FALSE(assembler.finish(error).has_value());
  EXPECT_EQ(error.code, manifest_error_code::invalid_structure);
}

TEST(assembler, manifest_chunk_before_meta_manifest_is_rejected) {
  auto served = serve(state_sync_version::v2);
  auto assembler = manifest_assembler{trusted_hash(served)};
  auto error = manifest_error{};
  EXPECT_FALSE(assembler.add_manifest_chunk(
      manifest_chunk_id(0), fetch(served, manifest_chunk_id(0)), error));
  EXPECT_EQ(error.code, manifest_error_code::invalid_structure);
}

TEST(assembler, non_manifest_ids_are_rejected) {
  auto served = serve(state_sync_version::v2);
  auto assembler = manifest_assembler{trusted_hash(served)};
  auto error = manifest_error{};
  ASSERT_TRUE(assembler.add_meta_manifest(
      fetch(served, statesync::manifest::kMetaManifestChunk), error));
  EXPECT_FALSE(assembler.add_manifest_chunk(
      statesync::manifest::file_chunk_id(0),
      fetch(served, statesync::manifest::file_chunk_id(0)), error));
  EXPECT_EQ(error.code, manifest_error_code::invalid_structure);
}

TEST(assembler, legacy_manifest_is_checked_against_table_hash) {
  auto served = serve(state_sync_version::v1);
  auto assembler = manifest_assembler{statesync::testing::make_hash(9)};
  auto error = manifest_error{};
  // Before V2 the meta-manifest is not what the trusted hash covers.
  ASSERT_TRUE(assembler.add_meta_manifest(
      fetch(served, statesync::manifest::kMetaManifestChunk), error));
  for (auto id : assembler.missing_manifest_chunks()) {
    ASSERT_TRUE(assembler.add_manifest_chunk(id, fetch(served, id), error));
  }
  EXPECT_FALSE(assembler.finish(error).has_value());
  EXPECT_EQ(error.code, manifest_error_code::hash_mismatch);
}

TEST(assembler, repeated_meta_manifest_keeps_verified_pieces) {
  auto served = serve(state_sync_version::v2);
  auto assembler = manifest_assembler{trusted_hash(served)};
  auto error = manifest_error{};
  auto meta_bytes = fetch(served, statesync::manifest::kMetaManifestChunk);
  ASSERT_TRUE(assembler.add_meta_manifest(meta_bytes, error));

  auto ids = assembler.missing_manifest_chunks();
  ASSERT_GE(ids.size(), 2u);
  ASSERT_TRUE(assembler.add_manifest_chunk(ids[0], fetch(served, ids[0]), error));

  ASSERT_TRUE(assembler.add_meta_manifest(meta_bytes, error));
  EXPECT_EQ(assembler.missing_manifest_chunks(),
            std::vector<uint32_t>(std::begin(ids) + 1, std::end(ids)));
}
