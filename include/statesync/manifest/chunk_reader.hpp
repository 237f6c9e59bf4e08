#pragma once

#include <statesync/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace statesync::manifest {

/// Reads `size` bytes at `offset` of a checkpoint file. Supplied by the
/// checkpoint reader; returns std::nullopt when the range is unavailable.
using chunk_reader_t =
    std::function<std::optional<statesync::schema::bytes_t>(
        std::string_view relative_path,
        uint64_t offset,
        uint32_t size)>;

}  // namespace statesync::manifest
