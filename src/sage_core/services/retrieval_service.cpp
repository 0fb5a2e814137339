#include "sage_core/services/retrieval_service.hpp"

#include <iostream>
#include <mutex>
#include <utility>

#include "sage_core/index/flat_vector_index.hpp"
#include "sage_core/services/document_identity.hpp"
#include "sage_core/text/text_utils.hpp"

namespace sage_core {

RetrievalService::RetrievalService(std::shared_ptr<Embedder> embedder,
                                   std::shared_ptr<Summarizer> summarizer,
                                   std::shared_ptr<StateStore> state_store,
                                   RetrievalSettings settings,
                                   std::unique_ptr<VectorIndex> index)
    : embedder_(embedder),
      state_store_(std::move(state_store)),
      settings_(settings),
      index_(index ? std::move(index) : std::make_unique<FlatVectorIndex>()),
      pipeline_(TextChunker(settings.chunking), embedder),
      retriever_(embedder),
      synthesizer_(std::move(summarizer), settings.synthesis) {
  if (!state_store_) {
    throw InvalidConfigurationError("RetrievalService requires a state store");
  }
  if (settings_.top_k <= 0) {
    throw InvalidConfigurationError("top_k must be greater than zero");
  }
}

void RetrievalService::initialize() {
  std::unique_lock lock(mutex_);
  initialized_ = false;
  corpus_.clear();
  index_->truncate(0);

  try {
    bool loaded = state_store_->load(*index_, corpus_, embedder_->model_name());
    if (loaded && index_->size() > 0 && index_->dimension() != embedder_->dimension()) {
      throw DimensionMismatchError("Persisted index has dimension " +
                                   std::to_string(index_->dimension()) + " but the embedder produces " +
                                   std::to_string(embedder_->dimension()));
    }
  } catch (...) {
    corpus_.clear();
    index_->truncate(0);
    throw;
  }

  dirty_ = false;
  initialized_ = true;
  std::clog << "[sage] Retrieval service ready: " << corpus_.documents().size() << " documents, "
            << index_->size() << " chunks" << std::endl;
}

void RetrievalService::ensure_initialized() const {
  if (!initialized_) {
    throw InvalidConfigurationError("Retrieval service has not been initialized");
  }
}

// Caller holds the exclusive lock.
void RetrievalService::persist_locked() {
  try {
    state_store_->save(*index_, corpus_, embedder_->model_name());
    dirty_ = false;
  } catch (...) {
    dirty_ = true;
    throw;
  }
}

IngestResult RetrievalService::ingest_document(const std::string &document_id,
                                               const std::string &raw_text) {
  try {
    ensure_initialized();
    {
      // Fail fast before paying for embeddings; commit checks again under the exclusive lock
      std::shared_lock lock(mutex_);
      if (corpus_.contains_document(document_id)) {
        throw DuplicateDocumentError("Document '" + document_id + "' is already stored");
      }
    }

    PreparedDocument prepared = pipeline_.prepare(document_id, raw_text);

    std::unique_lock lock(mutex_);
    pipeline_.commit(prepared, *index_, corpus_);
    persist_locked();

    std::clog << "[sage] Ingested document " << document_id << " (" << prepared.chunks.size()
              << " chunks)" << std::endl;
    return IngestResult::success_response(document_id, prepared.chunks.size());
  } catch (const SageError &e) {
    std::cerr << "[sage] Ingest of document '" << document_id << "' failed ("
              << to_string(e.kind()) << "): " << e.what() << std::endl;
    return IngestResult::failure_response(e.kind(), e.what(), document_id);
  } catch (const std::exception &e) {
    std::cerr << "[sage] Ingest of document '" << document_id << "' failed: " << e.what()
              << std::endl;
    return IngestResult::failure_response(ErrorKind::Internal, e.what(), document_id);
  }
}

IngestResult RetrievalService::ingest_document(const std::string &raw_text) {
  std::string document_id;
  try {
    document_id = generate_document_id();
  } catch (const std::exception &e) {
    std::cerr << "[sage] Could not generate a document id: " << e.what() << std::endl;
    return IngestResult::failure_response(ErrorKind::Internal, e.what());
  }
  return ingest_document(document_id, raw_text);
}

AnswerResult RetrievalService::answer_query(const std::string &query) {
  try {
    ensure_initialized();
    std::vector<Passage> passages = retrieve(query, settings_.top_k);
    return AnswerResult::success_response(synthesizer_.synthesize(query, passages));
  } catch (const EmptyIndexError &e) {
    return AnswerResult::failure_response(e.kind(), e.what());
  } catch (const SageError &e) {
    std::cerr << "[sage] Query failed (" << to_string(e.kind()) << "): " << e.what() << std::endl;
    return AnswerResult::failure_response(e.kind(), e.what());
  } catch (const std::exception &e) {
    std::cerr << "[sage] Query failed: " << e.what() << std::endl;
    return AnswerResult::failure_response(ErrorKind::Internal, e.what());
  }
}

std::vector<Passage> RetrievalService::retrieve(const std::string &query, int k) {
  ensure_initialized();
  std::vector<float> query_vector = retriever_.embed_query(query);

  std::shared_lock lock(mutex_);
  return retriever_.retrieve(query_vector, k, *index_, corpus_);
}

std::vector<DocumentInfo> RetrievalService::list_documents() const {
  std::shared_lock lock(mutex_);
  return corpus_.documents();
}

IndexStats RetrievalService::stats() const {
  std::shared_lock lock(mutex_);
  IndexStats stats;
  stats.vector_count = index_->size();
  stats.corpus_count = corpus_.size();
  stats.document_count = corpus_.documents().size();
  stats.dimension = index_->state() == IndexState::Active ? index_->dimension() : 0;
  return stats;
}

bool RetrievalService::flush() {
  ensure_initialized();
  std::unique_lock lock(mutex_);
  if (!dirty_) {
    return false;
  }
  persist_locked();
  std::clog << "[sage] Flushed pending state (" << index_->size() << " chunks)" << std::endl;
  return true;
}

bool RetrievalService::is_dirty() const {
  std::shared_lock lock(mutex_);
  return dirty_;
}

}  // namespace sage_core
