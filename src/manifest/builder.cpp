#include <spdlog/spdlog.h>
#include <statesync/common/critical.hpp>
#include <statesync/manifest/builder.hpp>
#include <statesync/manifest/hash.hpp>

#include <algorithm>
#include <atomic>
#include <iterator>
#include <limits>
#include <system_error>
#include <thread>

namespace statesync::manifest {

namespace {

struct file_slot final {
  schema::file_info file;
  std::vector<schema::chunk_info> chunks;
};

file_slot compute_file_slot(const schema::state_sync_version version,
                            const uint32_t file_index,
                            const schema::checkpoint_file& input,
                            const uint32_t chunk_size) {
  auto slot = file_slot{};
  slot.chunks = compute_file_chunks(
      file_index, schema::make_bytes_view(input.content), chunk_size);
  slot.file = schema::file_info{.relative_path = input.relative_path,
                                .size_bytes = input.content.size(),
                                .hash = file_hash(version, slot.chunks)};
  return slot;
}

}  // namespace

std::vector<schema::chunk_info> compute_file_chunks(
    const uint32_t file_index,
    const schema::bytes_view_t& content,
    const uint32_t chunk_size) {
  if (chunk_size == 0) {
    statesync::common::critical("chunk size must be positive");
  }
  auto chunks = std::vector<schema::chunk_info>{};
  chunks.reserve((content.size() + chunk_size - 1) / chunk_size);
  for (uint64_t offset = 0; offset < content.size(); offset += chunk_size) {
    auto size = static_cast<uint32_t>(
        std::min<uint64_t>(chunk_size, content.size() - offset));
    chunks.push_back(schema::chunk_info{
        .file_index = file_index,
        .size_bytes = size,
        .offset = offset,
        .hash = chunk_hash(content.subspan(offset, size))});
  }
  return chunks;
}

schema::manifest build_manifest(
    const std::vector<schema::checkpoint_file>& files,
    const build_options& options) {
  if (files.size() > std::numeric_limits<uint32_t>::max()) {
    statesync::common::critical("checkpoint has too many files for a manifest");
  }

  auto slots = std::vector<file_slot>(files.size());
  auto thread_count = std::clamp<std::size_t>(options.thread_count, 1,
                                              std::max<std::size_t>(
                                                  files.size(), 1));
  if (thread_count == 1) {
    for (std::size_t i = 0; i < files.size(); ++i) {
      slots[i] = compute_file_slot(options.version, static_cast<uint32_t>(i),
                                   files[i], options.chunk_size);
    }
  } else {
    // Each worker writes only the slots of the files it claimed, so the
    // joined tables keep file order regardless of completion order.
    auto next = std::atomic<std::size_t>{0};
    auto work = [&] {
      for (auto i = next.fetch_add(1); i < files.size();
           i = next.fetch_add(1)) {
        slots[i] = compute_file_slot(options.version, static_cast<uint32_t>(i),
                                     files[i], options.chunk_size);
      }
    };
    auto workers = std::vector<std::thread>{};
    workers.reserve(thread_count);
    try {
      for (std::size_t t = 0; t < thread_count; ++t) {
        workers.emplace_back(work);
      }
    } catch (const std::system_error& ex) {
      // Started workers stay joinable; the calling thread takes over the
      // share of the workers that could not be started.
      spdlog::warn("Started {} of {} hashing threads: {}", workers.size(),
                   thread_count, ex.what());
      work();
    }
    for (auto& worker : workers) {
      worker.join();
    }
  }

  auto file_table = std::vector<schema::file_info>{};
  auto chunk_table = std::vector<schema::chunk_info>{};
  file_table.reserve(slots.size());
  for (auto& slot : slots) {
    file_table.push_back(std::move(slot.file));
    std::move(std::begin(slot.chunks), std::end(slot.chunks),
              std::back_inserter(chunk_table));
  }
  if (chunk_table.size() > kFileGroupChunkIdOffset - kFileChunkIdOffset) {
    statesync::common::critical(
        "chunk table does not fit below the file group chunk id range");
  }

  spdlog::debug("Computed {} manifest with {} file(s) and {} chunk(s)",
                schema::to_string(options.version), file_table.size(),
                chunk_table.size());
  return schema::manifest{options.version, std::move(file_table),
                          std::move(chunk_table)};
}

}  // namespace statesync::manifest
