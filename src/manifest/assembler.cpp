#include <spdlog/spdlog.h>
#include <statesync/manifest/assembler.hpp>
#include <statesync/manifest/validate.hpp>
#include <statesync/schema/encoding/scale/manifest.hpp>

#include <fmt/format.h>
#include <algorithm>

namespace statesync::manifest {

manifest_assembler::manifest_assembler(schema::hash32_t trusted_hash)
    : trusted_hash_(trusted_hash) {}

bool manifest_assembler::add_meta_manifest(const schema::bytes_view_t& bytes,
                                           schema::manifest_error& error) {
  auto decoded = schema::encoding::decode_meta_manifest(bytes, error);
  if (!decoded) {
    spdlog::warn("Rejected meta-manifest: {}", error.message);
    return false;
  }
  // Before V2 the trusted hash covers the manifest tables, so it is checked
  // in finish() instead.
  if (decoded->version >= schema::state_sync_version::v2 &&
      !validate_meta_manifest(*decoded, trusted_hash_, error)) {
    spdlog::warn("Rejected meta-manifest: {}", error.message);
    return false;
  }
  if (meta_ == decoded) {
    return true;
  }
  meta_ = std::move(decoded);
  pieces_.clear();
  return true;
}

bool manifest_assembler::add_manifest_chunk(const uint32_t chunk_id,
                                            const schema::bytes_view_t& bytes,
                                            schema::manifest_error& error) {
  auto chunk = classify_chunk(chunk_id);
  if (chunk.kind != chunk_kind::manifest) {
    error = schema::manifest_error{
        .code = schema::manifest_error_code::invalid_structure,
        .message = fmt::format("chunk {} is a {} chunk, not a manifest chunk",
                               chunk_id, to_string(chunk.kind))};
    return false;
  }
  if (!meta_) {
    error = schema::manifest_error{
        .code = schema::manifest_error_code::invalid_structure,
        .message = "manifest chunk received before the meta-manifest"};
    return false;
  }
  if (!validate_sub_manifest(*meta_, chunk.index, bytes, error)) {
    spdlog::warn("Rejected manifest chunk {}: {}", chunk_id, error.message);
    return false;
  }
  pieces_.insert_or_assign(chunk.index, schema::make_bytes(bytes));
  return true;
}

std::vector<uint32_t> manifest_assembler::missing_manifest_chunks() const {
  auto missing = std::vector<uint32_t>{};
  if (!meta_) {
    return missing;
  }
  for (uint32_t index = 0; index < meta_->sub_manifest_hashes.size();
       ++index) {
    if (!pieces_.contains(index)) {
      missing.push_back(manifest_chunk_id(index));
    }
  }
  return missing;
}

bool manifest_assembler::complete() const {
  return meta_.has_value() &&
         pieces_.size() == meta_->sub_manifest_hashes.size();
}

std::optional<schema::manifest> manifest_assembler::finish(
    schema::manifest_error& error) const {
  if (!complete()) {
    error = schema::manifest_error{
        .code = schema::manifest_error_code::invalid_structure,
        .message = fmt::format("manifest is incomplete: {} chunk(s) missing",
                               missing_manifest_chunks().size())};
    return std::nullopt;
  }

  auto encoded = schema::bytes_t{};
  for (const auto& [index, piece] : pieces_) {
    encoded.insert(std::end(encoded), std::begin(piece), std::end(piece));
  }

  auto decoded = schema::encoding::decode_manifest(
      schema::make_bytes_view(encoded), error);
  if (!decoded) {
    return std::nullopt;
  }
  if ((*decoded)->version != meta_->version) {
    error = schema::manifest_error{
        .code = schema::manifest_error_code::invalid_structure,
        .message = fmt::format(
            "manifest version {} differs from meta-manifest version {}",
            schema::to_string((*decoded)->version),
            schema::to_string(meta_->version))};
    return std::nullopt;
  }
  // Pieces are cut at a fixed size, so the first of several pieces has it. A
  // single piece is reproduced by any size not below its length.
  auto sub_manifest_size = static_cast<uint32_t>(
      std::max<std::size_t>(std::begin(pieces_)->second.size(), 1));
  if (!validate_manifest(*decoded, trusted_hash_, error, sub_manifest_size)) {
    spdlog::warn("Rejected assembled manifest: {}", error.message);
    return std::nullopt;
  }
  spdlog::info("Assembled {} manifest with {} file(s) and {} chunk(s)",
               schema::to_string((*decoded)->version),
               (*decoded)->file_table.size(), (*decoded)->chunk_table.size());
  return decoded;
}

}  // namespace statesync::manifest
