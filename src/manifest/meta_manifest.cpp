#include <statesync/common/critical.hpp>
#include <statesync/manifest/hash.hpp>
#include <statesync/manifest/meta_manifest.hpp>
#include <statesync/schema/encoding/scale/manifest.hpp>

#include <algorithm>

namespace statesync::manifest {

uint32_t sub_manifest_count(const uint64_t encoded_size,
                            const uint32_t sub_manifest_size) {
  if (sub_manifest_size == 0) {
    statesync::common::critical("sub-manifest size must be positive");
  }
  return static_cast<uint32_t>((encoded_size + sub_manifest_size - 1) /
                               sub_manifest_size);
}

std::optional<schema::bytes_view_t> sub_manifest_piece(
    const schema::bytes_view_t& encoded_manifest,
    const uint32_t index,
    const uint32_t sub_manifest_size) {
  if (index >= sub_manifest_count(encoded_manifest.size(), sub_manifest_size)) {
    return std::nullopt;
  }
  auto offset = static_cast<std::size_t>(index) * sub_manifest_size;
  auto size = std::min<std::size_t>(sub_manifest_size,
                                    encoded_manifest.size() - offset);
  return encoded_manifest.subspan(offset, size);
}

schema::meta_manifest build_meta_manifest(
    const schema::state_sync_version version,
    const schema::bytes_view_t& encoded_manifest,
    const uint32_t sub_manifest_size) {
  auto count = sub_manifest_count(encoded_manifest.size(), sub_manifest_size);
  auto out = schema::meta_manifest{.version = version};
  out.sub_manifest_hashes.reserve(count);
  for (uint32_t index = 0; index < count; ++index) {
    out.sub_manifest_hashes.push_back(sub_manifest_hash(
        *sub_manifest_piece(encoded_manifest, index, sub_manifest_size)));
  }
  return out;
}

schema::meta_manifest build_meta_manifest(const schema::manifest& value,
                                          const uint32_t sub_manifest_size) {
  auto encoded = schema::encoding::encode_manifest(value);
  return build_meta_manifest(value->version, schema::make_bytes_view(encoded),
                             sub_manifest_size);
}

}  // namespace statesync::manifest
