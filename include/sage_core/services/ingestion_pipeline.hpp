#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sage_core/chunking/text_chunker.hpp"
#include "sage_core/db/corpus_store.hpp"
#include "sage_core/db/state_store.hpp"
#include "sage_core/embedding/embedder.hpp"
#include "sage_core/index/vector_index.hpp"
#include "sage_core/types/chunk.hpp"
#include "sage_core/types/document.hpp"

namespace sage_core {

// A document that has been chunked and embedded but not yet stored anywhere.
struct PreparedDocument {
  DocumentInfo info;
  std::vector<Chunk> chunks;
  std::vector<std::vector<float>> vectors;
};

/**
 * @brief chunk -> embed -> index -> append -> persist.
 *
 * `prepare` covers the two expensive steps and touches no shared state. `commit` applies the
 * result to the index and corpus as one unit: either both grow by the same rows and the
 * document is recorded, or neither changes. Callers serialize `commit` and the following save.
 */
class IngestionPipeline {
 public:
  IngestionPipeline(TextChunker chunker, std::shared_ptr<Embedder> embedder);

  // Throws EmptyDocumentError for blank text and ModelError if the embedder drops vectors.
  PreparedDocument prepare(const std::string &document_id, const std::string &raw_text) const;

  // Returns the row positions the chunks landed on.
  std::vector<int64_t> commit(const PreparedDocument &prepared,
                              VectorIndex &index,
                              CorpusStore &corpus) const;

  // prepare + commit + save, for callers that already hold exclusive access.
  PreparedDocument ingest(const std::string &document_id,
                          const std::string &raw_text,
                          VectorIndex &index,
                          CorpusStore &corpus,
                          StateStore &state_store) const;

 private:
  TextChunker chunker_;
  std::shared_ptr<Embedder> embedder_;
};

}  // namespace sage_core
