#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "sage_core/chunking/text_chunker.hpp"
#include "sage_core/db/corpus_store.hpp"
#include "sage_core/db/state_store.hpp"
#include "sage_core/embedding/embedder.hpp"
#include "sage_core/errors.hpp"
#include "sage_core/index/vector_index.hpp"
#include "sage_core/services/ingestion_pipeline.hpp"
#include "sage_core/services/retriever.hpp"
#include "sage_core/synthesis/summarizer.hpp"
#include "sage_core/synthesis/synthesizer.hpp"
#include "sage_core/types.hpp"

namespace sage_core {

struct IngestResult {
  bool success;
  std::optional<ErrorKind> error_kind;
  std::string error_message;
  std::string document_id;
  size_t chunk_count;

  static IngestResult success_response(const std::string &document_id, size_t chunk_count) {
    return {true, std::nullopt, "", document_id, chunk_count};
  }

  static IngestResult failure_response(ErrorKind kind,
                                       const std::string &error,
                                       const std::string &document_id = "") {
    return {false, kind, error, document_id, 0};
  }
};

struct AnswerResult {
  bool success;
  std::optional<ErrorKind> error_kind;
  std::string error_message;
  Answer answer;

  static AnswerResult success_response(Answer answer) {
    return {true, std::nullopt, "", std::move(answer)};
  }

  static AnswerResult failure_response(ErrorKind kind, const std::string &error) {
    return {false, kind, error, {}};
  }
};

struct RetrievalSettings {
  ChunkingPolicy chunking;
  int top_k = 5;
  SynthesisPolicy synthesis;
};

/**
 * @brief Owns the vector index / corpus store pair and serves ingest and answer requests.
 *
 * Mutations (commit plus save) run under an exclusive lock; retrieval and listing take a
 * shared lock. Embedding and summarization happen outside the lock. `ingest_document` and
 * `answer_query` never throw: every failure is reported in the result with its ErrorKind.
 */
class RetrievalService {
 public:
  RetrievalService(std::shared_ptr<Embedder> embedder,
                   std::shared_ptr<Summarizer> summarizer,
                   std::shared_ptr<StateStore> state_store,
                   RetrievalSettings settings = {},
                   std::unique_ptr<VectorIndex> index = nullptr);

  RetrievalService(const RetrievalService &) = delete;
  RetrievalService &operator=(const RetrievalService &) = delete;

  // Loads persisted state or starts empty. Throws on inconsistent state; the service stays
  // unusable until a successful initialize.
  void initialize();

  IngestResult ingest_document(const std::string &document_id, const std::string &raw_text);

  // Generates a random document id.
  IngestResult ingest_document(const std::string &raw_text);

  AnswerResult answer_query(const std::string &query);

  // Ranked passages for `query`. Throws SageError subclasses, EmptyIndexError included.
  std::vector<Passage> retrieve(const std::string &query, int k);

  std::vector<DocumentInfo> list_documents() const;

  IndexStats stats() const;

  // Retries the save after an earlier one failed. Returns true if anything was written.
  bool flush();

  bool is_dirty() const;

 private:
  void ensure_initialized() const;
  void persist_locked();

  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<StateStore> state_store_;
  RetrievalSettings settings_;
  std::unique_ptr<VectorIndex> index_;
  CorpusStore corpus_;

  IngestionPipeline pipeline_;
  Retriever retriever_;
  Synthesizer synthesizer_;

  mutable std::shared_mutex mutex_;
  std::atomic<bool> initialized_{false};
  bool dirty_ = false;
};

}  // namespace sage_core
