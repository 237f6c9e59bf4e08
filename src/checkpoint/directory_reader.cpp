#include <spdlog/spdlog.h>
#include <statesync/checkpoint/directory_reader.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace statesync::checkpoint {

namespace {

std::optional<statesync::schema::bytes_t> read_range(
    const std::filesystem::path& path,
    uint64_t offset,
    std::size_t size) {
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  in.seekg(static_cast<std::streamoff>(offset));
  auto content = statesync::schema::bytes_t(size);
  in.read(reinterpret_cast<char*>(content.data()),
          static_cast<std::streamsize>(size));
  if (static_cast<std::size_t>(in.gcount()) != size) {
    return std::nullopt;
  }
  return content;
}

}  // namespace

std::optional<std::vector<statesync::schema::checkpoint_file>>
read_checkpoint_directory(const std::filesystem::path& root,
                          std::string& error) {
  auto ec = std::error_code{};
  if (!std::filesystem::is_directory(root, ec)) {
    error = "checkpoint root '" + root.string() + "' is not a directory";
    return std::nullopt;
  }

  auto paths = std::vector<std::string>{};
  for (auto it = std::filesystem::recursive_directory_iterator{root, ec};
       !ec && it != std::filesystem::recursive_directory_iterator{};
       it.increment(ec)) {
    if (it->is_regular_file(ec)) {
      paths.push_back(
          std::filesystem::relative(it->path(), root, ec).generic_string());
    }
  }
  if (ec) {
    error = "failed to list checkpoint '" + root.string() + "': " +
            ec.message();
    return std::nullopt;
  }
  std::ranges::sort(paths);

  auto files = std::vector<statesync::schema::checkpoint_file>{};
  files.reserve(paths.size());
  for (auto& relative_path : paths) {
    auto full_path = root / relative_path;
    auto size = std::filesystem::file_size(full_path, ec);
    if (ec) {
      error = "failed to stat '" + full_path.string() + "': " + ec.message();
      return std::nullopt;
    }
    auto content = read_range(full_path, 0, size);
    if (!content) {
      error = "failed to read '" + full_path.string() + "'";
      return std::nullopt;
    }
    files.push_back(statesync::schema::checkpoint_file{
        .relative_path = std::move(relative_path),
        .content = std::move(*content)});
  }
  spdlog::debug("Read {} file(s) from checkpoint '{}'", files.size(),
                root.string());
  return files;
}

statesync::manifest::chunk_reader_t make_directory_chunk_reader(
    std::filesystem::path root) {
  return [root = std::move(root)](std::string_view relative_path,
                                  uint64_t offset, uint32_t size) {
    return read_range(root / std::filesystem::path{relative_path}, offset,
                      size);
  };
}

}  // namespace statesync::checkpoint
