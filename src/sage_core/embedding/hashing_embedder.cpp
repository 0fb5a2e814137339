#include "sage_core/embedding/hashing_embedder.hpp"

#include <cmath>

#include "sage_core/errors.hpp"
#include "sage_core/text/text_utils.hpp"

namespace sage_core {

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw InvalidConfigurationError("Embedding dimension must be greater than 0");
  }
}

std::string HashingEmbedder::model_name() const {
  return "hashing-fnv1a-" + std::to_string(dimension_);
}

uint64_t HashingEmbedder::fnv1a(std::string_view term) {
  uint64_t hash = 14695981039346656037ULL;
  for (char c : term) {
    hash ^= static_cast<unsigned char>(c);
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::vector<float> HashingEmbedder::embed_one(const std::string &text) const {
  std::vector<float> vec(dimension_, 0.0f);

  for (const auto &term : text::tokenize_terms(text)) {
    uint64_t h = fnv1a(term);
    size_t bucket = static_cast<size_t>(h % dimension_);
    vec[bucket] += (h >> 63) ? -1.0f : 1.0f;
  }

  float norm = 0.0f;
  for (float v : vec) {
    norm += v * v;
  }
  if (norm > 0.0f) {
    norm = std::sqrt(norm);
    for (float &v : vec) {
      v /= norm;
    }
  }
  return vec;
}

std::vector<std::vector<float>> HashingEmbedder::embed(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    out.push_back(embed_one(text));
  }
  return out;
}

}  // namespace sage_core
