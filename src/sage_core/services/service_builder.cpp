#include "sage_core/services/service_builder.hpp"

#include <filesystem>
#include <iostream>

#include "sage_core/db/database_manager.hpp"
#include "sage_core/db/sqlite_state_store.hpp"
#include "sage_core/embedding/hashing_embedder.hpp"
#include "sage_core/llm/ollama_client.hpp"
#include "sage_core/synthesis/extractive_summarizer.hpp"
#include "sage_core/synthesis/llm_summarizer.hpp"

namespace sage_core {

RetrievalSettings settings_from_config(const Config &config) {
  RetrievalSettings settings;
  settings.chunking.chunk_size = config.chunk_size;
  settings.chunking.overlap = config.chunk_overlap;
  settings.top_k = config.top_k;
  settings.synthesis.snippet_chars = config.snippet_chars;
  settings.synthesis.bounds.min_words = config.answer_min_words;
  settings.synthesis.bounds.max_words = config.answer_max_words;
  return settings;
}

std::unique_ptr<RetrievalService> build_retrieval_service(const Config &config) {
  std::filesystem::path data_dir(config.data_dir);

  // One client serves both roles when both point at Ollama
  std::shared_ptr<OllamaClient> ollama;
  if (config.embedder == "ollama" || config.summarizer == "llm") {
    std::clog << "[sage] Connecting to Ollama at " << config.ollama_url << std::endl;
    ollama = std::make_shared<OllamaClient>(config.ollama_url, config.embedding_model,
                                            config.generation_model);
  }

  std::shared_ptr<Embedder> embedder;
  if (config.embedder == "ollama") {
    embedder = ollama;
  } else {
    embedder = std::make_shared<HashingEmbedder>(config.embedding_dimension);
  }

  std::shared_ptr<Summarizer> summarizer;
  if (config.summarizer == "llm") {
    summarizer = std::make_shared<LlmSummarizer>(ollama);
  } else {
    summarizer = std::make_shared<ExtractiveSummarizer>();
  }

  auto db_manager = std::make_shared<DatabaseManager>(data_dir / "corpus.db");
  auto state_store = std::make_shared<SqliteStateStore>(db_manager, data_dir / "index.faiss",
                                                        config.compression_level);

  return std::make_unique<RetrievalService>(embedder, summarizer, state_store,
                                            settings_from_config(config));
}

}  // namespace sage_core
