#pragma once

#include <sqlite_modern_cpp.h>

#include <string>
#include <utility>

#include "sage_core/db/sqlite_error_utils.hpp"
#include "sage_core/errors.hpp"

namespace sage_core {

/**
 * Scoped write transaction on the corpus database.
 *
 * Rolls back on destruction unless commit() succeeded. A failed BEGIN or COMMIT is
 * reported as PersistenceError labelled with the operation name.
 */
class Transaction {
 public:
  Transaction(sqlite::database &db, std::string operation, bool immediate = true)
      : db_(db), operation_(std::move(operation)) {
    try {
      db_ << (immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
    } catch (const sqlite::sqlite_exception &e) {
      throw PersistenceError(format_db_error(operation_ + " begin", e));
    }
    open_ = true;
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    try {
      db_ << "COMMIT;";
    } catch (const sqlite::sqlite_exception &e) {
      throw PersistenceError(format_db_error(operation_ + " commit", e));
    }
    open_ = false;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &) {
      // sqlite already rolled back when the failing statement aborted
    }
  }

 private:
  sqlite::database &db_;
  std::string operation_;
  bool open_ = false;
};

}  // namespace sage_core
