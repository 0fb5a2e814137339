#include "sage_core/index/flat_vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>

#include <algorithm>
#include <cmath>

#include "sage_core/errors.hpp"

namespace sage_core {

FlatVectorIndex::FlatVectorIndex() = default;
FlatVectorIndex::~FlatVectorIndex() = default;

void FlatVectorIndex::validate_finite(const std::vector<float> &vector, const std::string &what) {
  for (float v : vector) {
    if (!std::isfinite(v)) {
      throw InvalidArgumentError(what + " contains a non-finite value");
    }
  }
}

std::vector<int64_t> FlatVectorIndex::insert(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    return {};
  }

  // Validate everything up front so a rejected batch leaves the index untouched.
  const size_t dim = index_ ? dimension() : vectors.front().size();
  if (dim == 0) {
    throw DimensionMismatchError("Cannot index zero-dimensional vectors");
  }
  std::vector<float> flat;
  flat.reserve(vectors.size() * dim);
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dim) {
      throw DimensionMismatchError("Vector dimension mismatch at batch index " +
                                   std::to_string(i) + ". Expected " + std::to_string(dim) +
                                   ", got " + std::to_string(vectors[i].size()));
    }
    validate_finite(vectors[i], "Vector at batch index " + std::to_string(i));
    flat.insert(flat.end(), vectors[i].begin(), vectors[i].end());
  }

  if (!index_) {
    index_ = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dim));
  }

  const int64_t first = static_cast<int64_t>(index_->ntotal);
  try {
    index_->add(static_cast<faiss::idx_t>(vectors.size()), flat.data());
  } catch (const faiss::FaissException &e) {
    throw InvalidArgumentError("Faiss rejected insert: " + std::string(e.what()));
  }

  std::vector<int64_t> positions(vectors.size());
  for (size_t i = 0; i < positions.size(); ++i) {
    positions[i] = first + static_cast<int64_t>(i);
  }
  return positions;
}

std::vector<SearchHit> FlatVectorIndex::search(const std::vector<float> &query, int k) const {
  if (!index_ || index_->ntotal == 0) {
    throw EmptyIndexError("No documents have been ingested yet. Upload a document before asking.");
  }
  if (k <= 0) {
    throw InvalidArgumentError("k must be greater than 0, got " + std::to_string(k));
  }
  if (query.size() != dimension()) {
    throw DimensionMismatchError("Query vector dimension mismatch. Expected " +
                                 std::to_string(dimension()) + ", got " +
                                 std::to_string(query.size()));
  }
  validate_finite(query, "Query vector");

  const faiss::idx_t actual_k = std::min<faiss::idx_t>(k, index_->ntotal);
  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  index_->search(1, query.data(), actual_k, distances.data(), labels.data());

  std::vector<SearchHit> hits;
  hits.reserve(actual_k);
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    if (labels[i] < 0 || !std::isfinite(distances[i]))
      continue;
    hits.push_back({static_cast<int64_t>(labels[i]), distances[i]});
  }
  return hits;
}

void FlatVectorIndex::truncate(size_t rows) {
  if (!index_ || rows >= size()) {
    return;
  }
  faiss::IDSelectorRange tail(static_cast<faiss::idx_t>(rows), index_->ntotal);
  index_->remove_ids(tail);
}

size_t FlatVectorIndex::size() const {
  return index_ ? static_cast<size_t>(index_->ntotal) : 0;
}

size_t FlatVectorIndex::dimension() const {
  return index_ ? static_cast<size_t>(index_->d) : 0;
}

IndexState FlatVectorIndex::state() const {
  return index_ ? IndexState::Active : IndexState::Uninitialized;
}

void FlatVectorIndex::write(const std::filesystem::path &path) const {
  if (!index_) {
    throw PersistenceError("Cannot write an uninitialized vector index to " + path.string());
  }
  try {
    faiss::write_index(index_.get(), path.c_str());
  } catch (const faiss::FaissException &e) {
    throw PersistenceError("Failed to write vector index to " + path.string() + ": " + e.what());
  }
}

void FlatVectorIndex::read(const std::filesystem::path &path) {
  std::unique_ptr<faiss::Index> loaded;
  try {
    loaded.reset(faiss::read_index(path.c_str()));
  } catch (const faiss::FaissException &e) {
    throw PersistenceError("Failed to read vector index from " + path.string() + ": " + e.what());
  }

  auto *flat = dynamic_cast<faiss::IndexFlatL2 *>(loaded.get());
  if (!flat) {
    throw PersistenceError("Index file " + path.string() + " is not a flat L2 index");
  }
  loaded.release();
  index_.reset(flat);
}

}  // namespace sage_core
