#include "sage_core/db/corpus_store.hpp"

#include "sage_core/errors.hpp"

namespace sage_core {

void CorpusStore::append(const std::vector<CorpusEntry> &entries) {
  // reserve first so growth cannot fail halfway through the copy
  entries_.reserve(entries_.size() + entries.size());
  entries_.insert(entries_.end(), entries.begin(), entries.end());
}

const CorpusEntry &CorpusStore::get(size_t position) const {
  if (position >= entries_.size()) {
    throw OutOfRangeError("Corpus position " + std::to_string(position) +
                          " is out of range (size " + std::to_string(entries_.size()) + ")");
  }
  return entries_[position];
}

void CorpusStore::truncate(size_t rows) {
  if (rows < entries_.size()) {
    entries_.resize(rows);
  }
}

void CorpusStore::add_document(const DocumentInfo &document) {
  if (document_slots_.count(document.document_id)) {
    throw DuplicateDocumentError("Document '" + document.document_id + "' is already stored");
  }
  documents_.push_back(document);
  document_slots_.emplace(document.document_id, documents_.size() - 1);
}

// Only used to undo add_document when the surrounding ingest fails.
void CorpusStore::remove_document(const std::string &document_id) {
  auto it = document_slots_.find(document_id);
  if (it == document_slots_.end())
    return;
  documents_.erase(documents_.begin() + static_cast<std::ptrdiff_t>(it->second));
  document_slots_.clear();
  for (size_t i = 0; i < documents_.size(); ++i) {
    document_slots_.emplace(documents_[i].document_id, i);
  }
}

bool CorpusStore::contains_document(const std::string &document_id) const {
  return document_slots_.count(document_id) > 0;
}

void CorpusStore::clear() {
  entries_.clear();
  documents_.clear();
  document_slots_.clear();
}

}  // namespace sage_core
