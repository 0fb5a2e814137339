#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "sage_core/synthesis/summarizer.hpp"
#include "sage_core/types/answer.hpp"
#include "sage_core/types/passage.hpp"

namespace sage_core {

struct SynthesisPolicy {
  size_t snippet_chars = 200;
  SummaryBounds bounds;
};

/**
 * @brief Packages a summarizer's answer together with the passages it was built from.
 *
 * Sources follow the passage order exactly, nearest first, and each snippet is the first
 * `snippet_chars` characters of its chunk. Answers longer than `bounds.max_words` are cut on
 * a word boundary whatever the summarizer returned.
 */
class Synthesizer {
 public:
  static constexpr const char *NO_PASSAGES_ANSWER =
      "I don't know based on the provided documents.";

  // Throws InvalidConfigurationError for an empty snippet or inverted word bounds.
  explicit Synthesizer(std::shared_ptr<Summarizer> summarizer, SynthesisPolicy policy = {});

  Answer synthesize(const std::string &query, const std::vector<Passage> &passages) const;

  // Passage texts in retrieval order separated by blank lines.
  static std::string build_context(const std::vector<Passage> &passages);

 private:
  std::vector<Source> build_sources(const std::vector<Passage> &passages) const;

  std::shared_ptr<Summarizer> summarizer_;
  SynthesisPolicy policy_;
};

}  // namespace sage_core
