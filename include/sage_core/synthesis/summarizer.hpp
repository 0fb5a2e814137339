#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "sage_core/types/passage.hpp"

namespace sage_core {

struct SummaryBounds {
  size_t min_words = 30;
  size_t max_words = 130;
};

/**
 * @brief Condenses retrieved passages into answer text for a query.
 *
 * Implementations aim for `bounds.min_words`..`bounds.max_words` words and must only use
 * what the passages say. Called without the service lock held, possibly concurrently.
 */
class Summarizer {
 public:
  virtual ~Summarizer() = default;

  virtual std::string summarize(const std::string &query,
                                const std::vector<Passage> &passages,
                                const SummaryBounds &bounds) = 0;
};

}  // namespace sage_core
