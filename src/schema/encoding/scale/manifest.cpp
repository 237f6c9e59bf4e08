#include <statesync/schema/encoding/scale/encoder.hpp>
#include <statesync/schema/encoding/scale/manifest.hpp>

#include <fmt/format.h>
#include <tuple>
#include <utility>
#include <vector>

using namespace statesync::schema;

namespace {

using encoder_t = statesync::schema::encoding::encoder<
    statesync::schema::encoding::scale_encoder_tag>;

constexpr auto kVersionPrefixSize = sizeof(uint32_t);

std::optional<state_sync_version> decode_version_prefix(
    const bytes_view_t& bytes,
    std::string_view what,
    manifest_error& error) {
  if (bytes.size() < kVersionPrefixSize) {
    error = manifest_error{
        .code = manifest_error_code::decode_failed,
        .message = fmt::format("failed to decode {}: {} bytes is too short "
                               "for the version prefix",
                               what, bytes.size())};
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto raw = encoder.try_decode<uint32_t>(bytes.first(kVersionPrefixSize));
  if (!raw) {
    error = manifest_error{
        .code = manifest_error_code::decode_failed,
        .message = fmt::format("failed to decode {} version", what)};
    return std::nullopt;
  }
  auto version = try_make_state_sync_version(*raw);
  if (!version) {
    error = manifest_error{
        .code = manifest_error_code::version_unsupported,
        .message = fmt::format(
            "{} version {} is not supported (maximum supported is {})", what,
            *raw, to_string(kMaxSupportedStateSyncVersion))};
    return std::nullopt;
  }
  return version;
}

}  // namespace

namespace statesync::schema::encoding {

bytes_t encode_manifest(const manifest& value) {
  auto encoder = encoder_t{};
  auto out = bytes_t{};
  encoder.encode(to_underlying(value->version), out);
  encoder.encode(value->file_table, out);
  encoder.encode(value->chunk_table, out);
  return out;
}

std::optional<manifest> decode_manifest(const bytes_view_t& bytes,
                                        manifest_error& error) {
  auto version = decode_version_prefix(bytes, "manifest", error);
  if (!version) {
    return std::nullopt;
  }

  auto encoder = encoder_t{};
  auto codec_error = std::string{};
  auto decoded = encoder.try_decode<
      std::tuple<uint32_t, std::vector<file_info>, std::vector<chunk_info>>>(
      bytes, codec_error);
  if (!decoded) {
    error = manifest_error{
        .code = manifest_error_code::decode_failed,
        .message = fmt::format("failed to decode manifest: {}", codec_error)};
    return std::nullopt;
  }

  auto& [raw_version, file_table, chunk_table] = decoded.value();
  static_cast<void>(raw_version);
  return manifest{*version, std::move(file_table), std::move(chunk_table)};
}

bytes_t encode_meta_manifest(const meta_manifest& value) {
  auto encoder = encoder_t{};
  auto out = bytes_t{};
  encoder.encode(to_underlying(value.version), out);
  encoder.encode(value.sub_manifest_hashes, out);
  return out;
}

std::optional<meta_manifest> decode_meta_manifest(const bytes_view_t& bytes,
                                                  manifest_error& error) {
  auto version = decode_version_prefix(bytes, "meta-manifest", error);
  if (!version) {
    return std::nullopt;
  }

  auto encoder = encoder_t{};
  auto codec_error = std::string{};
  auto decoded =
      encoder.try_decode<std::tuple<uint32_t, std::vector<hash32_t>>>(
          bytes, codec_error);
  if (!decoded) {
    error = manifest_error{
        .code = manifest_error_code::decode_failed,
        .message =
            fmt::format("failed to decode meta-manifest: {}", codec_error)};
    return std::nullopt;
  }

  return meta_manifest{.version = *version,
                       .sub_manifest_hashes =
                           std::move(std::get<1>(decoded.value()))};
}

}  // namespace statesync::schema::encoding
