#include <spdlog/spdlog.h>
#include <statesync/manifest/file_group.hpp>
#include <statesync/manifest/validate.hpp>

#include <fmt/format.h>
#include <string_view>

namespace statesync::manifest {

schema::file_group_chunks build_file_group_chunks(
    const schema::manifest& value,
    const file_group_options& options) {
  auto groups = schema::file_group_chunks::map_t{};
  auto next_id = kFileGroupChunkIdOffset;
  auto current = std::vector<uint32_t>{};
  auto current_bytes = uint64_t{0};

  auto flush = [&] {
    if (current.empty()) {
      return;
    }
    groups.emplace(next_id++, std::move(current));
    current.clear();
    current_bytes = 0;
  };

  auto ranges = file_chunk_ranges(value);
  for (std::size_t file_index = 0; file_index < ranges.size(); ++file_index) {
    const auto& file = value->file_table[file_index];
    auto [begin, end] = ranges[file_index];
    if (end - begin != 1 || file.size_bytes > options.max_file_size_bytes ||
        file.size_bytes > options.max_group_bytes ||
        !std::string_view{file.relative_path}.ends_with(options.path_suffix)) {
      continue;
    }
    if (current_bytes + file.size_bytes > options.max_group_bytes) {
      flush();
    }
    current.push_back(static_cast<uint32_t>(begin));
    current_bytes += file.size_bytes;
  }
  flush();

  spdlog::debug("Grouped small files into {} file group chunk(s)",
                groups.size());
  return schema::file_group_chunks{std::move(groups)};
}

std::optional<schema::bytes_t> assemble_file_group_chunk(
    const schema::manifest& value,
    const std::vector<uint32_t>& chunk_table_indices,
    const chunk_reader_t& reader) {
  auto payload = schema::bytes_t{};
  for (auto index : chunk_table_indices) {
    if (index >= value->chunk_table.size()) {
      return std::nullopt;
    }
    const auto& chunk = value->chunk_table[index];
    if (chunk.file_index >= value->file_table.size()) {
      spdlog::warn("File group member {} references missing file {}", index,
                   chunk.file_index);
      return std::nullopt;
    }
    const auto& file = value->file_table[chunk.file_index];
    auto content = reader(file.relative_path, chunk.offset, chunk.size_bytes);
    if (!content || content->size() != chunk.size_bytes) {
      return std::nullopt;
    }
    payload.insert(std::end(payload), std::begin(*content), std::end(*content));
  }
  return payload;
}

std::optional<std::vector<schema::bytes_t>> split_file_group_chunk(
    const schema::manifest& value,
    const std::vector<uint32_t>& chunk_table_indices,
    const schema::bytes_view_t& payload,
    schema::manifest_error& error) {
  auto expected_size = uint64_t{0};
  for (auto index : chunk_table_indices) {
    if (index >= value->chunk_table.size()) {
      error = schema::manifest_error{
          .code = schema::manifest_error_code::invalid_structure,
          .message = fmt::format("file group references chunk {} but the "
                                 "chunk table has {} entries",
                                 index, value->chunk_table.size())};
      return std::nullopt;
    }
    expected_size += value->chunk_table[index].size_bytes;
  }
  if (payload.size() != expected_size) {
    error = schema::manifest_error{
        .code = schema::manifest_error_code::invalid_structure,
        .message = fmt::format("file group payload has {} bytes, expected {}",
                               payload.size(), expected_size)};
    return std::nullopt;
  }

  auto pieces = std::vector<schema::bytes_t>{};
  pieces.reserve(chunk_table_indices.size());
  auto offset = std::size_t{0};
  for (auto index : chunk_table_indices) {
    auto size = value->chunk_table[index].size_bytes;
    auto piece = payload.subspan(offset, size);
    if (!validate_chunk(value, index, piece, error)) {
      return std::nullopt;
    }
    pieces.push_back(schema::make_bytes(piece));
    offset += size;
  }
  return pieces;
}

}  // namespace statesync::manifest
