#include <spdlog/spdlog.h>
#include <statesync/manifest/chunk_source.hpp>
#include <statesync/manifest/file_group.hpp>
#include <statesync/manifest/meta_manifest.hpp>
#include <statesync/schema/encoding/scale/manifest.hpp>

namespace statesync::manifest {

chunk_source::chunk_source(schema::manifest value,
                           schema::file_group_chunks groups,
                           chunk_reader_t reader,
                           const uint32_t sub_manifest_size)
    : manifest_(std::move(value)),
      meta_(build_meta_manifest(manifest_, sub_manifest_size)),
      groups_(std::move(groups)),
      reader_(std::move(reader)),
      sub_manifest_size_(sub_manifest_size) {}

std::optional<schema::bytes_t> chunk_source::get_chunk(
    const uint32_t chunk_id) const {
  auto chunk = classify_chunk(chunk_id);
  switch (chunk.kind) {
    case chunk_kind::meta_manifest:
      return schema::encoding::encode_meta_manifest(meta_);
    case chunk_kind::file:
      return get_file_chunk(chunk.index);
    case chunk_kind::file_group: {
      auto members = groups_.find(chunk.index);
      if (members == nullptr) {
        spdlog::warn("Requested unknown file group chunk {}", chunk_id);
        return std::nullopt;
      }
      return assemble_file_group_chunk(manifest_, *members, reader_);
    }
    case chunk_kind::manifest:
      return get_manifest_chunk(chunk.index);
  }
  return std::nullopt;
}

std::optional<schema::bytes_t> chunk_source::get_file_chunk(
    const uint32_t chunk_table_index) const {
  if (chunk_table_index >= manifest_->chunk_table.size()) {
    spdlog::warn("Requested file chunk {} beyond chunk table of {} entries",
                 chunk_table_index, manifest_->chunk_table.size());
    return std::nullopt;
  }
  const auto& chunk = manifest_->chunk_table[chunk_table_index];
  if (chunk.file_index >= manifest_->file_table.size()) {
    spdlog::warn("File chunk {} references missing file {}", chunk_table_index,
                 chunk.file_index);
    return std::nullopt;
  }
  const auto& file = manifest_->file_table[chunk.file_index];
  auto content = reader_(file.relative_path, chunk.offset, chunk.size_bytes);
  if (!content || content->size() != chunk.size_bytes) {
    spdlog::warn("Failed to read chunk {} of '{}'", chunk_table_index,
                 file.relative_path);
    return std::nullopt;
  }
  return content;
}

std::optional<schema::bytes_t> chunk_source::get_manifest_chunk(
    const uint32_t index) const {
  auto encoded = schema::encoding::encode_manifest(manifest_);
  auto piece = sub_manifest_piece(schema::make_bytes_view(encoded), index,
                                  sub_manifest_size_);
  if (!piece) {
    spdlog::warn("Requested manifest chunk {} beyond {} sub-manifest(s)",
                 index, meta_.sub_manifest_hashes.size());
    return std::nullopt;
  }
  return schema::make_bytes(*piece);
}

}  // namespace statesync::manifest
