#include "sage_core/services/ingestion_pipeline.hpp"

#include <chrono>
#include <utility>

#include "sage_core/errors.hpp"
#include "sage_core/services/document_identity.hpp"
#include "sage_core/text/text_utils.hpp"

namespace sage_core {

IngestionPipeline::IngestionPipeline(TextChunker chunker, std::shared_ptr<Embedder> embedder)
    : chunker_(std::move(chunker)), embedder_(std::move(embedder)) {
  if (!embedder_) {
    throw InvalidConfigurationError("IngestionPipeline requires an embedder");
  }
}

PreparedDocument IngestionPipeline::prepare(const std::string &document_id,
                                            const std::string &raw_text) const {
  if (text::trim(document_id).empty()) {
    throw InvalidArgumentError("Document id must not be empty");
  }
  if (text::trim(raw_text).empty()) {
    throw EmptyDocumentError("Document '" + document_id + "' contains no text");
  }

  std::vector<std::string> pieces = chunker_.split(raw_text);
  if (pieces.empty()) {
    throw EmptyDocumentError("Document '" + document_id + "' produced no chunks");
  }

  PreparedDocument prepared;
  prepared.chunks.reserve(pieces.size());
  for (size_t i = 0; i < pieces.size(); ++i) {
    prepared.chunks.push_back(Chunk{document_id, std::move(pieces[i]), static_cast<int>(i)});
  }

  std::vector<std::string> texts;
  texts.reserve(prepared.chunks.size());
  for (const auto &chunk : prepared.chunks) {
    texts.push_back(chunk.content);
  }
  prepared.vectors = embedder_->embed(texts);
  if (prepared.vectors.size() != prepared.chunks.size()) {
    throw ModelError("Embedder returned " + std::to_string(prepared.vectors.size()) +
                     " vectors for " + std::to_string(prepared.chunks.size()) + " chunks");
  }

  prepared.info.document_id = document_id;
  prepared.info.content_hash = compute_content_hash(raw_text);
  prepared.info.chunk_count = prepared.chunks.size();
  prepared.info.created_at = std::chrono::system_clock::now();
  return prepared;
}

std::vector<int64_t> IngestionPipeline::commit(const PreparedDocument &prepared,
                                               VectorIndex &index,
                                               CorpusStore &corpus) const {
  const size_t rows_before = index.size();
  if (corpus.size() != rows_before) {
    throw OutOfRangeError("Vector index has " + std::to_string(rows_before) +
                          " rows but the corpus has " + std::to_string(corpus.size()));
  }

  // Throws DuplicateDocumentError before anything else changes
  corpus.add_document(prepared.info);

  std::vector<int64_t> positions;
  try {
    positions = index.insert(prepared.vectors);
    corpus.append(prepared.chunks);
  } catch (...) {
    index.truncate(rows_before);
    corpus.truncate(rows_before);
    corpus.remove_document(prepared.info.document_id);
    throw;
  }
  return positions;
}

PreparedDocument IngestionPipeline::ingest(const std::string &document_id,
                                           const std::string &raw_text,
                                           VectorIndex &index,
                                           CorpusStore &corpus,
                                           StateStore &state_store) const {
  PreparedDocument prepared = prepare(document_id, raw_text);
  commit(prepared, index, corpus);
  state_store.save(index, corpus, embedder_->model_name());
  return prepared;
}

}  // namespace sage_core
