#include "sage_core/db/sqlite_state_store.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

#include "sage_core/db/sqlite_error_utils.hpp"
#include "sage_core/db/transaction.hpp"
#include "sage_core/errors.hpp"
#include "sage_core/services/compression_service.hpp"

namespace sage_core {

namespace {

struct StoredEntry {
  int64_t position;
  CorpusEntry entry;
  std::vector<char> compressed_content;
};

}  // namespace

SqliteStateStore::SqliteStateStore(std::shared_ptr<DatabaseManager> db_manager,
                                   std::filesystem::path index_path,
                                   int compression_level)
    : db_manager_(std::move(db_manager)),
      index_path_(std::move(index_path)),
      compression_level_(compression_level) {
  if (!db_manager_) {
    throw InvalidConfigurationError("SqliteStateStore requires a database manager");
  }
}

std::string SqliteStateStore::time_point_to_string(const std::chrono::system_clock::time_point &tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point SqliteStateStore::string_to_time_point(
    const std::string &time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw PersistenceError("Failed to parse time string: " + time_str +
                           ". Expected format YYYY-MM-DD HH:MM:SS.");
  }
  // We stored GMT time.
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

bool SqliteStateStore::load(VectorIndex &index,
                            CorpusStore &corpus,
                            const std::string &embedding_model) {
  std::optional<Manifest> manifest;
  std::vector<StoredEntry> rows;
  std::vector<DocumentInfo> documents;

  try {
    auto &db = db_manager_->connection();
    db << "SELECT row_count, dimension, embedding_model FROM index_manifest WHERE id = 1" >>
        [&](int64_t row_count, int64_t dimension, std::string model) {
          manifest = Manifest{row_count, dimension, std::move(model)};
        };

    db << "SELECT position, document_id, chunk_index, content FROM corpus_entries "
          "ORDER BY position" >>
        [&](int64_t position, std::string document_id, int chunk_index, std::vector<char> content) {
          StoredEntry row;
          row.position = position;
          row.entry.document_id = std::move(document_id);
          row.entry.chunk_index = chunk_index;
          row.compressed_content = std::move(content);
          rows.push_back(std::move(row));
        };

    db << "SELECT document_id, content_hash, chunk_count, created_at FROM documents "
          "ORDER BY ordinal" >>
        [&](std::string document_id, std::string content_hash, int64_t chunk_count,
            std::string created_at) {
          DocumentInfo info;
          info.document_id = std::move(document_id);
          info.content_hash = std::move(content_hash);
          info.chunk_count = static_cast<size_t>(chunk_count);
          info.created_at = string_to_time_point(created_at);
          documents.push_back(std::move(info));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw PersistenceError(format_db_error("load_state", e));
  }

  const bool index_file_exists = std::filesystem::exists(index_path_);
  if (!manifest && rows.empty() && documents.empty() && !index_file_exists) {
    return false;
  }

  if (!manifest) {
    throw OutOfRangeError("Persisted corpus has no index manifest; refusing to load " +
                          db_manager_->path().string());
  }
  if (manifest->embedding_model != embedding_model) {
    throw InvalidConfigurationError("Persisted index was built with embedding model '" +
                                    manifest->embedding_model + "' but '" + embedding_model +
                                    "' is configured");
  }

  index.truncate(0);
  if (manifest->row_count > 0) {
    if (!index_file_exists) {
      throw OutOfRangeError("Manifest records " + std::to_string(manifest->row_count) +
                            " rows but index file " + index_path_.string() + " is missing");
    }
    index.read(index_path_);
  }

  // Fail closed: every count must agree before anything is handed to the caller.
  const size_t index_rows = index.size();
  if (index_rows != rows.size() || static_cast<int64_t>(rows.size()) != manifest->row_count) {
    throw OutOfRangeError("Persisted state is inconsistent: index has " +
                          std::to_string(index_rows) + " rows, corpus has " +
                          std::to_string(rows.size()) + ", manifest records " +
                          std::to_string(manifest->row_count));
  }
  if (index_rows > 0 && static_cast<int64_t>(index.dimension()) != manifest->dimension) {
    throw DimensionMismatchError("Index file dimension " + std::to_string(index.dimension()) +
                                 " does not match manifest dimension " +
                                 std::to_string(manifest->dimension));
  }
  size_t documented_chunks = 0;
  for (const auto &document : documents) {
    documented_chunks += document.chunk_count;
  }
  if (documented_chunks != rows.size()) {
    throw OutOfRangeError("Document records account for " + std::to_string(documented_chunks) +
                          " chunks but the corpus holds " + std::to_string(rows.size()));
  }

  std::vector<CorpusEntry> entries;
  entries.reserve(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    if (rows[i].position != static_cast<int64_t>(i)) {
      throw OutOfRangeError("Corpus positions are not contiguous: expected " + std::to_string(i) +
                            ", found " + std::to_string(rows[i].position));
    }
    rows[i].entry.content = CompressionService::decompress(rows[i].compressed_content);
    entries.push_back(std::move(rows[i].entry));
  }

  corpus.clear();
  corpus.append(entries);
  for (const auto &document : documents) {
    corpus.add_document(document);
  }

  std::clog << "[state] Loaded " << corpus.size() << " chunks from " << documents.size()
            << " documents (" << index_path_.string() << ")" << std::endl;
  return true;
}

void SqliteStateStore::save(const VectorIndex &index,
                            const CorpusStore &corpus,
                            const std::string &embedding_model) {
  if (index.size() != corpus.size()) {
    throw OutOfRangeError("Refusing to persist: index has " + std::to_string(index.size()) +
                          " rows but corpus has " + std::to_string(corpus.size()));
  }

  std::filesystem::path staged_index = index_path_;
  staged_index += ".tmp";
  if (index.size() > 0) {
    if (index_path_.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(index_path_.parent_path(), ec);
      if (ec) {
        throw PersistenceError("Failed to create index directory: " + ec.message());
      }
    }
    index.write(staged_index);
  }

  try {
    auto &db = db_manager_->connection();
    Transaction tx(db, "save_state");

    db << "DELETE FROM corpus_entries;";
    db << "DELETE FROM documents;";

    const auto &entries = corpus.entries();
    for (size_t i = 0; i < entries.size(); ++i) {
      const auto &entry = entries[i];
      db << "INSERT INTO corpus_entries (position, document_id, chunk_index, content) "
            "VALUES (?, ?, ?, ?)"
         << static_cast<int64_t>(i) << entry.document_id << entry.chunk_index
         << CompressionService::compress(entry.content, compression_level_);
    }

    const auto &documents = corpus.documents();
    for (size_t i = 0; i < documents.size(); ++i) {
      const auto &document = documents[i];
      db << "INSERT INTO documents (document_id, content_hash, chunk_count, created_at, ordinal) "
            "VALUES (?, ?, ?, ?, ?)"
         << document.document_id << document.content_hash
         << static_cast<int64_t>(document.chunk_count) << time_point_to_string(document.created_at)
         << static_cast<int64_t>(i);
    }

    db << "REPLACE INTO index_manifest (id, row_count, dimension, embedding_model, updated_at) "
          "VALUES (1, ?, ?, ?, ?)"
       << static_cast<int64_t>(index.size()) << static_cast<int64_t>(index.dimension())
       << embedding_model << time_point_to_string(std::chrono::system_clock::now());

    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    std::error_code ignored;
    std::filesystem::remove(staged_index, ignored);
    throw PersistenceError(format_db_error("save_state", e));
  } catch (const SageError &) {
    std::error_code ignored;
    std::filesystem::remove(staged_index, ignored);
    throw;
  }

  std::error_code ec;
  if (index.size() > 0) {
    std::filesystem::rename(staged_index, index_path_, ec);
  } else {
    std::filesystem::remove(index_path_, ec);
  }
  if (ec) {
    throw PersistenceError("Failed to publish index file " + index_path_.string() + ": " +
                           ec.message());
  }
}

}  // namespace sage_core
