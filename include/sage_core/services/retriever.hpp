#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sage_core/db/corpus_store.hpp"
#include "sage_core/embedding/embedder.hpp"
#include "sage_core/index/vector_index.hpp"
#include "sage_core/types/passage.hpp"

namespace sage_core {

/**
 * @brief Turns a query into ranked passages: embed, search, then join on row position.
 *
 * Split in two halves so the owner can embed without holding its state lock and only take a
 * shared lock for the search and join.
 */
class Retriever {
 public:
  explicit Retriever(std::shared_ptr<Embedder> embedder);

  // Throws InvalidArgumentError for a blank query.
  std::vector<float> embed_query(const std::string &query) const;

  // Passages in ascending distance order, at most `k`. EmptyIndexError propagates unchanged.
  std::vector<Passage> retrieve(const std::vector<float> &query_vector,
                                int k,
                                const VectorIndex &index,
                                const CorpusStore &corpus) const;

  std::vector<Passage> retrieve(const std::string &query,
                                int k,
                                const VectorIndex &index,
                                const CorpusStore &corpus) const;

 private:
  std::shared_ptr<Embedder> embedder_;
};

}  // namespace sage_core
