#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "sage_core/db/database_manager.hpp"
#include "sage_core/db/state_store.hpp"

namespace sage_core {

/**
 * @brief Persists chunk payloads in SQLite and vectors in a faiss index file.
 *
 * A save rewrites the corpus tables and the manifest inside one transaction, then moves the
 * freshly written index file into place. If the process dies between the two, the manifest and
 * the index file disagree and the next load refuses to start.
 */
class SqliteStateStore : public StateStore {
 public:
  SqliteStateStore(std::shared_ptr<DatabaseManager> db_manager,
                   std::filesystem::path index_path,
                   int compression_level = 3);

  bool load(VectorIndex &index, CorpusStore &corpus, const std::string &embedding_model) override;
  void save(const VectorIndex &index,
            const CorpusStore &corpus,
            const std::string &embedding_model) override;

  const std::filesystem::path &index_path() const {
    return index_path_;
  }

 private:
  struct Manifest {
    int64_t row_count = 0;
    int64_t dimension = 0;
    std::string embedding_model;
  };

  std::shared_ptr<DatabaseManager> db_manager_;
  std::filesystem::path index_path_;
  int compression_level_;

  // Time point conversions
  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);
};

}  // namespace sage_core
