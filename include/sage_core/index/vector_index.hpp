#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace sage_core {

// An index starts Uninitialized; the first non-empty insert fixes its dimension.
enum class IndexState { Uninitialized, Active };

struct SearchHit {
  int64_t position;
  float distance;
};

/**
 * @brief Row-addressed vector index.
 *
 * Rows are numbered from 0 in insertion order and never reordered, so callers can join search
 * hits against any parallel sequence by position.
 */
class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  // Appends `vectors` in order and returns their row positions.
  virtual std::vector<int64_t> insert(const std::vector<std::vector<float>> &vectors) = 0;

  // At most `k` hits sorted by ascending distance. Throws EmptyIndexError when no rows exist.
  virtual std::vector<SearchHit> search(const std::vector<float> &query, int k) const = 0;

  // Drops every row at or after `rows`. Used to roll back a failed insert.
  virtual void truncate(size_t rows) = 0;

  virtual size_t size() const = 0;
  virtual size_t dimension() const = 0;
  virtual IndexState state() const = 0;

  virtual void write(const std::filesystem::path &path) const = 0;
  virtual void read(const std::filesystem::path &path) = 0;
};

}  // namespace sage_core
