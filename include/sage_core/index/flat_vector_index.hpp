#pragma once

#include <faiss/IndexFlat.h>

#include <memory>

#include "sage_core/index/vector_index.hpp"

namespace sage_core {

// Exact brute-force search under squared Euclidean distance (faiss::IndexFlatL2).
class FlatVectorIndex : public VectorIndex {
 public:
  FlatVectorIndex();
  ~FlatVectorIndex() override;

  // Disable copy constructor and assignment
  FlatVectorIndex(const FlatVectorIndex &) = delete;
  FlatVectorIndex &operator=(const FlatVectorIndex &) = delete;

  std::vector<int64_t> insert(const std::vector<std::vector<float>> &vectors) override;
  std::vector<SearchHit> search(const std::vector<float> &query, int k) const override;
  void truncate(size_t rows) override;

  size_t size() const override;
  size_t dimension() const override;
  IndexState state() const override;

  void write(const std::filesystem::path &path) const override;
  void read(const std::filesystem::path &path) override;

 private:
  // Null while Uninitialized
  std::unique_ptr<faiss::IndexFlatL2> index_;

  static void validate_finite(const std::vector<float> &vector, const std::string &what);
};

}  // namespace sage_core
