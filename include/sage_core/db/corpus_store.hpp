#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "sage_core/types/chunk.hpp"
#include "sage_core/types/document.hpp"

namespace sage_core {

using CorpusEntry = Chunk;

/**
 * @brief Chunk payloads addressed by vector index row position.
 *
 * Append-only. Entry i belongs to vector index row i; the retrieval service keeps the two
 * sequences the same length. The store also keeps one DocumentInfo per ingested document.
 * Not synchronized: callers hold the service lock.
 */
class CorpusStore {
 public:
  CorpusStore() = default;

  void append(const std::vector<CorpusEntry> &entries);

  // Throws OutOfRangeError if position >= size().
  const CorpusEntry &get(size_t position) const;

  size_t size() const {
    return entries_.size();
  }

  // Drops every entry at or after `rows`.
  void truncate(size_t rows);

  void add_document(const DocumentInfo &document);
  void remove_document(const std::string &document_id);
  bool contains_document(const std::string &document_id) const;
  const std::vector<DocumentInfo> &documents() const {
    return documents_;
  }

  const std::vector<CorpusEntry> &entries() const {
    return entries_;
  }

  void clear();

 private:
  std::vector<CorpusEntry> entries_;
  std::vector<DocumentInfo> documents_;
  std::unordered_map<std::string, size_t> document_slots_;
};

}  // namespace sage_core
