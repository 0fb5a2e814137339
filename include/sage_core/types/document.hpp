#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace sage_core {

struct DocumentInfo {
  std::string document_id;
  std::string content_hash;
  size_t chunk_count = 0;
  std::chrono::system_clock::time_point created_at;
};

struct IndexStats {
  size_t vector_count = 0;
  size_t corpus_count = 0;
  size_t document_count = 0;
  size_t dimension = 0;
};

}  // namespace sage_core
