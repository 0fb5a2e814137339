#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace sage_core {

// Short label plus an operator hint for the primary SQLite result codes the corpus
// database can realistically hit.
struct SqliteFailure {
  const char *label;
  const char *hint;
};

inline SqliteFailure describe_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return {"busy", "another process holds the corpus database"};
    case SQLITE_READONLY:
    case SQLITE_PERM:
      return {"readonly", "the data directory is not writable"};
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return {"io", "check free space in the data directory"};
    case SQLITE_CANTOPEN:
      return {"cantopen", "the corpus database path cannot be opened"};
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return {"corrupt", "remove the data directory and ingest again"};
    case SQLITE_CONSTRAINT:
      return {"constraint", ""};
    default:
      return {"sqlite", ""};
  }
}

inline std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e) {
  const SqliteFailure failure = describe_sqlite_code(e.get_code());
  std::string msg = operation + " failed (" + failure.label + "): " + e.what();
  if (*failure.hint != '\0') {
    msg += "; ";
    msg += failure.hint;
  }
  msg += " [xcode=" + std::to_string(e.get_extended_code()) + "]";
  return msg;
}

}  // namespace sage_core
