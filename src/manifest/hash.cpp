#include <statesync/blake3/hash.hpp>
#include <statesync/manifest/hash.hpp>
#include <statesync/manifest/meta_manifest.hpp>

namespace statesync::manifest {

namespace {

void write_chunk_entry(statesync::blake3::hasher& hasher,
                       const schema::chunk_info& chunk,
                       const bool with_file_index) {
  if (with_file_index) {
    hasher.write(chunk.file_index);
  }
  hasher.write(chunk.size_bytes);
  hasher.write(chunk.offset);
  hasher.write(chunk.hash);
}

void write_file_entry(statesync::blake3::hasher& hasher,
                      const schema::file_info& file) {
  hasher.write_prefixed(schema::make_bytes_view(file.relative_path));
  hasher.write(file.size_bytes);
  hasher.write(file.hash);
}

}  // namespace

schema::hash32_t chunk_hash(const schema::bytes_view_t& content) {
  return statesync::blake3::hasher{kChunkDomain}.write(content).finish();
}

schema::hash32_t file_hash(const schema::state_sync_version version,
                           std::span<const schema::chunk_info> chunks) {
  const auto with_file_index = version < schema::state_sync_version::v3;
  auto hasher = statesync::blake3::hasher{kFileDomain};
  hasher.write(static_cast<uint32_t>(chunks.size()));
  for (const auto& chunk : chunks) {
    write_chunk_entry(hasher, chunk, with_file_index);
  }
  return hasher.finish();
}

schema::hash32_t legacy_manifest_hash(const schema::manifest& value) {
  auto hasher = statesync::blake3::hasher{kManifestDomain};
  if (value->version >= schema::state_sync_version::v1) {
    hasher.write(schema::to_underlying(value->version));
  }

  hasher.write(static_cast<uint32_t>(value->file_table.size()));
  for (const auto& file : value->file_table) {
    write_file_entry(hasher, file);
  }

  if (value->version >= schema::state_sync_version::v1) {
    hasher.write(static_cast<uint32_t>(value->chunk_table.size()));
    for (const auto& chunk : value->chunk_table) {
      write_chunk_entry(hasher, chunk, true);
    }
  }
  return hasher.finish();
}

schema::hash32_t sub_manifest_hash(const schema::bytes_view_t& piece) {
  return statesync::blake3::hasher{kSubManifestDomain}.write(piece).finish();
}

schema::hash32_t meta_manifest_hash(const schema::meta_manifest& value) {
  auto hasher = statesync::blake3::hasher{kMetaManifestDomain};
  hasher.write(schema::to_underlying(value.version));
  hasher.write(static_cast<uint32_t>(value.sub_manifest_hashes.size()));
  for (const auto& hash : value.sub_manifest_hashes) {
    hasher.write(hash);
  }
  return hasher.finish();
}

schema::hash32_t manifest_hash(const schema::manifest& value,
                               const uint32_t sub_manifest_size) {
  if (value->version <= schema::state_sync_version::v1) {
    return legacy_manifest_hash(value);
  }
  return meta_manifest_hash(build_meta_manifest(value, sub_manifest_size));
}

}  // namespace statesync::manifest
