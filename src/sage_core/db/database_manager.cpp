#include "sage_core/db/database_manager.hpp"

#include "sage_core/db/sqlite_error_utils.hpp"
#include "sage_core/errors.hpp"

namespace sage_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path) : db_path_(db_path) {
  try {
    if (db_path_.has_parent_path()) {
      std::filesystem::create_directories(db_path_.parent_path());
    }
    db_ = std::make_unique<sqlite::database>(db_path_.string());
    setup_schema();
  } catch (const sqlite::sqlite_exception &e) {
    throw PersistenceError(format_db_error("open " + db_path_.string(), e));
  } catch (const std::filesystem::filesystem_error &e) {
    throw PersistenceError("Failed to create database directory: " + std::string(e.what()));
  }
}

sqlite::database &DatabaseManager::connection() {
  return *db_;
}

void DatabaseManager::setup_schema() {
  *db_ << "PRAGMA foreign_keys = ON;";
  *db_ << "PRAGMA journal_mode = WAL;";

  // position mirrors the vector index row number
  *db_ << R"(
      CREATE TABLE IF NOT EXISTS corpus_entries (
          position INTEGER PRIMARY KEY,
          document_id TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          content BLOB NOT NULL
      )
    )";

  *db_ << R"(
      CREATE TABLE IF NOT EXISTS documents (
          document_id TEXT PRIMARY KEY,
          content_hash TEXT NOT NULL,
          chunk_count INTEGER NOT NULL,
          created_at TEXT NOT NULL,
          ordinal INTEGER NOT NULL
      )
    )";

  // single row describing what the index file on disk should contain
  *db_ << R"(
      CREATE TABLE IF NOT EXISTS index_manifest (
          id INTEGER PRIMARY KEY CHECK (id = 1),
          row_count INTEGER NOT NULL,
          dimension INTEGER NOT NULL,
          embedding_model TEXT NOT NULL,
          updated_at TEXT NOT NULL
      )
    )";

  *db_ << R"(
      CREATE INDEX IF NOT EXISTS idx_corpus_entries_document
      ON corpus_entries(document_id, chunk_index)
    )";
}

}  // namespace sage_core
