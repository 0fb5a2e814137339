#pragma once

#include <cstdint>

#include "sage_core/types/chunk.hpp"

namespace sage_core {

// A retrieved chunk together with its squared L2 distance to the query and the
// row position it occupies in the vector index / corpus store.
struct Passage {
  Chunk chunk;
  float distance = 0.0f;
  int64_t position = -1;
};

}  // namespace sage_core
