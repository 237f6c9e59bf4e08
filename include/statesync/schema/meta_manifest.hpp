#pragma once

#include <statesync/schema/primitives.hpp>
#include <statesync/schema/state_sync_version.hpp>

#include <vector>

// Schema type: meta-manifest.
// Hashes of the consecutive pieces (sub-manifests) of an encoded manifest.
// This is the only manifest value transferred before the manifest itself.
namespace statesync::schema {

struct meta_manifest final {
  state_sync_version version{kCurrentStateSyncVersion};
  std::vector<hash32_t> sub_manifest_hashes;

  bool operator==(const meta_manifest&) const = default;
};

}  // namespace statesync::schema
