#pragma once

#include <sqlite_modern_cpp.h>

#include <filesystem>
#include <memory>
#include <string>

namespace sage_core {

/**
 * @brief Owns the SQLite connection backing the corpus store and sets up its schema.
 *
 * Constructed once at startup and handed to the components that persist through it.
 * The connection is not synchronized; the retrieval service serializes writers.
 */
class DatabaseManager {
 public:
  explicit DatabaseManager(const std::filesystem::path &db_path);

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

  sqlite::database &connection();

  const std::filesystem::path &path() const {
    return db_path_;
  }

 private:
  void setup_schema();

  std::filesystem::path db_path_;
  std::unique_ptr<sqlite::database> db_;
};

}  // namespace sage_core
