#pragma once

#include <statesync/manifest/chunk_reader.hpp>
#include <statesync/schema/checkpoint_file.hpp>
#include <statesync/schema/file_group_chunks.hpp>
#include <statesync/schema/primitives.hpp>
#include <blake3.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace statesync::testing {

inline statesync::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = statesync::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Plain BLAKE3 of `bytes`, without any domain separator.
inline statesync::schema::hash32_t blake3_digest(
    const statesync::schema::bytes_view_t& bytes) {
  auto state = blake3_hasher{};
  blake3_hasher_init(&state);
  blake3_hasher_update(&state, bytes.data(), bytes.size());
  auto output = statesync::schema::hash32_t{};
  blake3_hasher_finalize(&state, output.data(), output.size());
  return output;
}

/// Big-endian byte string builder mirroring the hash input layouts.
struct hash_input final {
  statesync::schema::bytes_t bytes;

  explicit hash_input(const std::string_view domain) {
    bytes.push_back(static_cast<uint8_t>(domain.size()));
    raw(statesync::schema::make_bytes_view(domain));
  }

  hash_input& u32(const uint32_t value) {
    for (auto shift = 24; shift >= 0; shift -= 8) {
      bytes.push_back(static_cast<uint8_t>(value >> shift));
    }
    return *this;
  }

  hash_input& u64(const uint64_t value) {
    for (auto shift = 56; shift >= 0; shift -= 8) {
      bytes.push_back(static_cast<uint8_t>(value >> shift));
    }
    return *this;
  }

  hash_input& raw(const statesync::schema::bytes_view_t& value) {
    bytes.insert(std::end(bytes), std::begin(value), std::end(value));
    return *this;
  }

  statesync::schema::hash32_t digest() const {
    return blake3_digest(statesync::schema::make_bytes_view(bytes));
  }
};

/// `size` pseudo-random bytes, deterministic per seed.
inline statesync::schema::bytes_t make_content(const std::size_t size,
                                               const uint8_t seed) {
  auto out = statesync::schema::bytes_t(size);
  auto state = uint64_t{0x9E3779B97F4A7C15ull} ^ seed;
  for (auto& byte : out) {
    state = (state * 6364136223846793005ull) + 1442695040888963407ull;
    byte = static_cast<uint8_t>(state >> 56u);
  }
  return out;
}

inline statesync::schema::checkpoint_file make_file(
    const std::string_view path,
    const std::size_t size,
    const uint8_t seed) {
  return statesync::schema::checkpoint_file{
      .relative_path = std::string{path}, .content = make_content(size, seed)};
}

/// Chunk reader over in-memory checkpoint files.
inline statesync::manifest::chunk_reader_t make_memory_chunk_reader(
    const std::vector<statesync::schema::checkpoint_file>& files) {
  auto contents = std::map<std::string, statesync::schema::bytes_t, std::less<>>{};
  for (const auto& file : files) {
    contents.emplace(file.relative_path, file.content);
  }
  return [contents = std::move(contents)](std::string_view relative_path,
                                          uint64_t offset, uint32_t size)
             -> std::optional<statesync::schema::bytes_t> {
    auto it = contents.find(relative_path);
    if (it == std::end(contents) || offset + size > it->second.size()) {
      return std::nullopt;
    }
    auto begin = std::begin(it->second) + static_cast<std::ptrdiff_t>(offset);
    return statesync::schema::bytes_t{begin, begin + size};
  };
}

inline statesync::schema::file_group_chunks make_groups(
    std::initializer_list<
        std::pair<const uint32_t, std::vector<uint32_t>>> entries) {
  return statesync::schema::file_group_chunks{
      statesync::schema::file_group_chunks::map_t(entries)};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void write_file(const std::filesystem::path& path,
                       const statesync::schema::bytes_t& content) {
  std::filesystem::create_directories(path.parent_path());
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out.write(reinterpret_cast<const char*>(content.data()),
            static_cast<std::streamsize>(content.size()));
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace statesync::testing
