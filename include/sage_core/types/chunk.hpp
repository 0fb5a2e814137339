#pragma once

#include <string>

namespace sage_core {

struct Chunk {
  std::string document_id;
  std::string content;
  int chunk_index = 0;
};

}  // namespace sage_core
