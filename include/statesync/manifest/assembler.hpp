#pragma once

#include <statesync/manifest/chunk_id.hpp>
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/manifest_error.hpp>
#include <statesync/schema/meta_manifest.hpp>
#include <statesync/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace statesync::manifest {

/// Rebuilds a manifest from chunks fetched from peers.
///
/// Every piece is checked as it arrives: the meta-manifest against the
/// trusted hash (V2 and later), each manifest chunk against its
/// sub-manifest hash. A rejected piece leaves already accepted pieces in
/// place so only it has to be fetched again. `finish` returns a manifest only
/// once every piece is present and the decoded manifest validates against the
/// trusted hash.
class manifest_assembler final {
 public:
  explicit manifest_assembler(statesync::schema::hash32_t trusted_hash);

  /// Accept the encoded meta-manifest (chunk 0).
  bool add_meta_manifest(const statesync::schema::bytes_view_t& bytes,
                         statesync::schema::manifest_error& error);

  /// Accept manifest chunk `chunk_id` (in the manifest chunk range).
  bool add_manifest_chunk(uint32_t chunk_id,
                          const statesync::schema::bytes_view_t& bytes,
                          statesync::schema::manifest_error& error);

  bool has_meta_manifest() const { return meta_.has_value(); }

  /// Manifest chunk ids that still have to be fetched, ascending. Empty
  /// until the meta-manifest is known.
  std::vector<uint32_t> missing_manifest_chunks() const;

  bool complete() const;

  /// Decode and validate the assembled manifest.
  std::optional<statesync::schema::manifest> finish(
      statesync::schema::manifest_error& error) const;

  const std::optional<statesync::schema::meta_manifest>& meta() const {
    return meta_;
  }

 private:
  statesync::schema::hash32_t trusted_hash_;
  std::optional<statesync::schema::meta_manifest> meta_;
  std::map<uint32_t, statesync::schema::bytes_t> pieces_;
};

}  // namespace statesync::manifest
