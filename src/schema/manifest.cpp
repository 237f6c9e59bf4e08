#include <statesync/schema/manifest.hpp>

namespace statesync::schema {

manifest::manifest(state_sync_version version,
                   std::vector<file_info> file_table,
                   std::vector<chunk_info> chunk_table)
    : data_(std::make_shared<const manifest_data>(
          manifest_data{.version = version,
                        .file_table = std::move(file_table),
                        .chunk_table = std::move(chunk_table)})) {}

}  // namespace statesync::schema
