#pragma once

#include <string>

#include "sage_core/db/corpus_store.hpp"
#include "sage_core/index/vector_index.hpp"

namespace sage_core {

/**
 * @brief Durable home of the vector index / corpus store pair.
 *
 * `load` is called once at startup, `save` after every ingest. Implementations must refuse
 * (throw) rather than repair a persisted state whose index and corpus disagree.
 */
class StateStore {
 public:
  virtual ~StateStore() = default;

  // Returns false when nothing has been persisted yet; `index` and `corpus` are left empty.
  virtual bool load(VectorIndex &index, CorpusStore &corpus, const std::string &embedding_model) = 0;

  // Rewrites the whole persisted state from `index` and `corpus`.
  virtual void save(const VectorIndex &index,
                    const CorpusStore &corpus,
                    const std::string &embedding_model) = 0;
};

}  // namespace sage_core
