#include <statesync/manifest/chunk_id.hpp>
#include <statesync/manifest/hash.hpp>
#include <statesync/manifest/validate.hpp>

#include <fmt/format.h>
#include <span>
#include <unordered_set>

namespace statesync::manifest {

namespace {

bool fail(schema::manifest_error& error,
          const schema::manifest_error_code code,
          std::string message) {
  error = schema::manifest_error{.code = code, .message = std::move(message)};
  return false;
}

}  // namespace

bool validate_manifest_structure(const schema::manifest& value,
                                 schema::manifest_error& error) {
  const auto& files = value->file_table;
  const auto& chunks = value->chunk_table;

  for (std::size_t i = 0; i < chunks.size(); ++i) {
    if (chunks[i].file_index >= files.size()) {
      return fail(error, schema::manifest_error_code::invalid_structure,
                  fmt::format("chunk {} references file {} but the file "
                              "table has {} entries",
                              i, chunks[i].file_index, files.size()));
    }
  }

  auto position = std::size_t{0};
  for (std::size_t file_index = 0; file_index < files.size(); ++file_index) {
    auto covered = uint64_t{0};
    while (position < chunks.size() &&
           chunks[position].file_index == file_index) {
      const auto& chunk = chunks[position];
      if (chunk.size_bytes == 0) {
        return fail(error, schema::manifest_error_code::invalid_structure,
                    fmt::format("chunk {} is empty", position));
      }
      if (chunk.offset != covered) {
        return fail(error, schema::manifest_error_code::invalid_structure,
                    fmt::format("chunk {} of file {} starts at offset {}, "
                                "expected {}",
                                position, file_index, chunk.offset, covered));
      }
      covered += chunk.size_bytes;
      ++position;
    }
    if (covered != files[file_index].size_bytes) {
      return fail(error, schema::manifest_error_code::invalid_structure,
                  fmt::format("chunks of file {} cover {} bytes, file size "
                              "is {}",
                              file_index, covered,
                              files[file_index].size_bytes));
    }
  }

  if (position != chunks.size()) {
    return fail(error, schema::manifest_error_code::invalid_structure,
                fmt::format("chunk {} of file {} is out of file order",
                            position, chunks[position].file_index));
  }
  return true;
}

bool validate_manifest(const schema::manifest& value,
                       const schema::hash32_t& expected_hash,
                       schema::manifest_error& error,
                       const uint32_t sub_manifest_size) {
  if (!validate_manifest_structure(value, error)) {
    return false;
  }

  auto ranges = file_chunk_ranges(value);
  auto chunks = std::span<const schema::chunk_info>{value->chunk_table};
  for (std::size_t i = 0; i < ranges.size(); ++i) {
    auto [begin, end] = ranges[i];
    auto computed =
        file_hash(value->version, chunks.subspan(begin, end - begin));
    if (computed != value->file_table[i].hash) {
      return fail(error, schema::manifest_error_code::hash_mismatch,
                  fmt::format("file hash mismatch for '{}': expected {}, "
                              "computed {}",
                              value->file_table[i].relative_path,
                              schema::to_hex(value->file_table[i].hash),
                              schema::to_hex(computed)));
    }
  }

  auto computed = manifest_hash(value, sub_manifest_size);
  if (computed != expected_hash) {
    return fail(error, schema::manifest_error_code::hash_mismatch,
                fmt::format("manifest hash mismatch: expected {}, computed {}",
                            schema::to_hex(expected_hash),
                            schema::to_hex(computed)));
  }
  return true;
}

bool validate_chunk(const schema::manifest& value,
                    const uint32_t chunk_table_index,
                    const schema::bytes_view_t& content,
                    schema::manifest_error& error) {
  if (chunk_table_index >= value->chunk_table.size()) {
    return fail(error, schema::manifest_error_code::invalid_structure,
                fmt::format("chunk index {} is out of range ({} chunks)",
                            chunk_table_index, value->chunk_table.size()));
  }
  const auto& chunk = value->chunk_table[chunk_table_index];
  if (content.size() != chunk.size_bytes) {
    return fail(error, schema::manifest_error_code::invalid_structure,
                fmt::format("chunk {} has {} bytes, expected {}",
                            chunk_table_index, content.size(),
                            chunk.size_bytes));
  }
  auto computed = chunk_hash(content);
  if (computed != chunk.hash) {
    return fail(error, schema::manifest_error_code::hash_mismatch,
                fmt::format("chunk {} hash mismatch: expected {}, computed {}",
                            chunk_table_index, schema::to_hex(chunk.hash),
                            schema::to_hex(computed)));
  }
  return true;
}

bool validate_sub_manifest(const schema::meta_manifest& meta,
                           const uint32_t index,
                           const schema::bytes_view_t& piece,
                           schema::manifest_error& error) {
  if (index >= meta.sub_manifest_hashes.size()) {
    return fail(error, schema::manifest_error_code::invalid_structure,
                fmt::format("sub-manifest index {} is out of range ({} "
                            "sub-manifests)",
                            index, meta.sub_manifest_hashes.size()));
  }
  auto computed = sub_manifest_hash(piece);
  if (computed != meta.sub_manifest_hashes[index]) {
    return fail(error, schema::manifest_error_code::hash_mismatch,
                fmt::format("sub-manifest {} hash mismatch: expected {}, "
                            "computed {}",
                            index,
                            schema::to_hex(meta.sub_manifest_hashes[index]),
                            schema::to_hex(computed)));
  }
  return true;
}

bool validate_meta_manifest(const schema::meta_manifest& meta,
                            const schema::hash32_t& expected_hash,
                            schema::manifest_error& error) {
  auto computed = meta_manifest_hash(meta);
  if (computed != expected_hash) {
    return fail(error, schema::manifest_error_code::hash_mismatch,
                fmt::format("meta-manifest hash mismatch: expected {}, "
                            "computed {}",
                            schema::to_hex(expected_hash),
                            schema::to_hex(computed)));
  }
  return true;
}

bool validate_file_group_chunks(const schema::manifest& value,
                                const schema::file_group_chunks& groups,
                                schema::manifest_error& error) {
  auto seen = std::unordered_set<uint32_t>{};
  for (const auto& [chunk_id, indices] : groups) {
    if (classify_chunk(chunk_id).kind != chunk_kind::file_group) {
      return fail(error, schema::manifest_error_code::invalid_structure,
                  fmt::format("file group id {} is outside the file group "
                              "range",
                              chunk_id));
    }
    if (indices.empty()) {
      return fail(error, schema::manifest_error_code::invalid_structure,
                  fmt::format("file group {} is empty", chunk_id));
    }
    for (auto index : indices) {
      if (index >= value->chunk_table.size()) {
        return fail(error, schema::manifest_error_code::invalid_structure,
                    fmt::format("file group {} references chunk {} but the "
                                "chunk table has {} entries",
                                chunk_id, index, value->chunk_table.size()));
      }
      if (!seen.insert(index).second) {
        return fail(error, schema::manifest_error_code::invalid_structure,
                    fmt::format("chunk {} belongs to more than one file "
                                "group",
                                index));
      }
    }
  }
  return true;
}

std::vector<std::pair<std::size_t, std::size_t>> file_chunk_ranges(
    const schema::manifest& value) {
  auto ranges = std::vector<std::pair<std::size_t, std::size_t>>{};
  ranges.reserve(value->file_table.size());
  auto position = std::size_t{0};
  for (std::size_t file_index = 0; file_index < value->file_table.size();
       ++file_index) {
    auto begin = position;
    while (position < value->chunk_table.size() &&
           value->chunk_table[position].file_index == file_index) {
      ++position;
    }
    ranges.emplace_back(begin, position);
  }
  return ranges;
}

}  // namespace statesync::manifest
