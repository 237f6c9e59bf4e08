#pragma once

#include <statesync/schema/manifest.hpp>

#include <ostream>
#include <string>

namespace statesync::manifest {

/// Human readable dump of the version, file table and chunk table. For
/// diagnostics only.
std::string render_manifest(const statesync::schema::manifest& value);

}  // namespace statesync::manifest

namespace statesync::schema {

std::string to_string(const manifest& value);

std::ostream& operator<<(std::ostream& out, const manifest& value);

}  // namespace statesync::schema
