#pragma once

#include <statesync/manifest/chunk_reader.hpp>
#include <statesync/schema/checkpoint_file.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace statesync::checkpoint {

/// Read every regular file below `root`, ordered by relative path so the
/// order is stable across reads. On failure `error` names the offending path.
std::optional<std::vector<statesync::schema::checkpoint_file>>
read_checkpoint_directory(const std::filesystem::path& root,
                          std::string& error);

/// Chunk reader serving byte ranges of the files below `root`.
statesync::manifest::chunk_reader_t make_directory_chunk_reader(
    std::filesystem::path root);

}  // namespace statesync::checkpoint
