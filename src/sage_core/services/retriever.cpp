#include "sage_core/services/retriever.hpp"

#include <utility>

#include "sage_core/errors.hpp"
#include "sage_core/text/text_utils.hpp"

namespace sage_core {

Retriever::Retriever(std::shared_ptr<Embedder> embedder) : embedder_(std::move(embedder)) {
  if (!embedder_) {
    throw InvalidConfigurationError("Retriever requires an embedder");
  }
}

std::vector<float> Retriever::embed_query(const std::string &query) const {
  if (text::trim(query).empty()) {
    throw InvalidArgumentError("Query must not be empty");
  }
  auto vectors = embedder_->embed({query});
  if (vectors.size() != 1) {
    throw ModelError("Embedder returned " + std::to_string(vectors.size()) +
                     " vectors for a single query");
  }
  return std::move(vectors.front());
}

std::vector<Passage> Retriever::retrieve(const std::vector<float> &query_vector,
                                         int k,
                                         const VectorIndex &index,
                                         const CorpusStore &corpus) const {
  std::vector<SearchHit> hits = index.search(query_vector, k);

  std::vector<Passage> passages;
  passages.reserve(hits.size());
  for (const auto &hit : hits) {
    // get() throws OutOfRangeError if the corpus fell behind the index
    const CorpusEntry &entry = corpus.get(static_cast<size_t>(hit.position));
    passages.push_back(Passage{entry, hit.distance, hit.position});
  }
  return passages;
}

std::vector<Passage> Retriever::retrieve(const std::string &query,
                                         int k,
                                         const VectorIndex &index,
                                         const CorpusStore &corpus) const {
  return retrieve(embed_query(query), k, index, corpus);
}

}  // namespace sage_core
