#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sage_core/llm/text_generator.hpp"
#include "sage_core/synthesis/summarizer.hpp"

namespace sage_core {

// Asks a text generation model for an answer grounded in numbered context blocks.
class LlmSummarizer : public Summarizer {
 public:
  explicit LlmSummarizer(std::shared_ptr<TextGenerator> generator);

  std::string summarize(const std::string &query,
                        const std::vector<Passage> &passages,
                        const SummaryBounds &bounds) override;

  static std::string build_prompt(const std::string &query,
                                  const std::vector<Passage> &passages,
                                  const SummaryBounds &bounds);

 private:
  std::shared_ptr<TextGenerator> generator_;
};

}  // namespace sage_core
