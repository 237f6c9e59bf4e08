#pragma once
#include <statesync/schema/manifest.hpp>
#include <statesync/schema/meta_manifest.hpp>
#include <statesync/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace statesync::storage {

template <typename Library>
struct storage {
  /// Persist the manifest of the checkpoint at `height` together with its
  /// meta-manifest, atomically.
  void save_manifest(uint64_t height,
                     const statesync::schema::manifest& manifest,
                     const statesync::schema::meta_manifest& meta) const;

  /// Load the manifest persisted for `height`, or std::nullopt when missing.
  std::optional<statesync::schema::manifest> load_manifest(
      uint64_t height) const;

  /// Load the meta-manifest persisted for `height`, or std::nullopt when
  /// missing.
  std::optional<statesync::schema::meta_manifest> load_meta_manifest(
      uint64_t height) const;

  /// Heights with a persisted manifest, ascending.
  std::vector<uint64_t> list_manifest_heights() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace statesync::storage
