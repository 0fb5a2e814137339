#pragma once

#include <string>
#include <vector>

#include "sage_core/synthesis/summarizer.hpp"

namespace sage_core {

/**
 * @brief Offline summarizer that answers with sentences copied from the passages.
 *
 * Sentences are ranked by how many distinct query terms they contain (earlier sentences win
 * ties) and picked until `min_words` is reached. Picked sentences keep their original order
 * and the total never exceeds `max_words`.
 */
class ExtractiveSummarizer : public Summarizer {
 public:
  std::string summarize(const std::string &query,
                        const std::vector<Passage> &passages,
                        const SummaryBounds &bounds) override;

  // Splits on sentence punctuation followed by whitespace and on line breaks.
  static std::vector<std::string> split_sentences(const std::string &text);
};

}  // namespace sage_core
