#pragma once

#include <statesync/schema/primitives.hpp>

#include <string>

// Schema type: checkpoint file.
// One file handed over by the checkpoint reader, in checkpoint order.
namespace statesync::schema {

struct checkpoint_file final {
  std::string relative_path;
  bytes_t content;
};

}  // namespace statesync::schema
