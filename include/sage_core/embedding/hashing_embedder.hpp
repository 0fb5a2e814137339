#pragma once

#include <cstdint>
#include <string_view>

#include "sage_core/embedding/embedder.hpp"

namespace sage_core {

// Offline bag-of-words embedder (hashing trick). Each term is hashed with 64-bit FNV-1a into
// one of `dimension` buckets with a hash-derived sign, then the vector is L2-normalized.
// FNV-1a keeps vectors stable across standard libraries, unlike std::hash.
class HashingEmbedder : public Embedder {
 public:
  static constexpr size_t DEFAULT_DIMENSION = 384;

  explicit HashingEmbedder(size_t dimension = DEFAULT_DIMENSION);

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;
  std::vector<float> embed_one(const std::string &text) const;

  size_t dimension() const override {
    return dimension_;
  }
  std::string model_name() const override;

 private:
  static uint64_t fnv1a(std::string_view term);

  size_t dimension_;
};

}  // namespace sage_core
