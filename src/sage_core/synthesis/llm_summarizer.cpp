#include "sage_core/synthesis/llm_summarizer.hpp"

#include <sstream>
#include <string_view>
#include <utility>

#include "sage_core/errors.hpp"
#include "sage_core/text/text_utils.hpp"

namespace sage_core {

namespace {

constexpr std::string_view kInstructions = R"(You are a retrieval-augmented assistant.
Answer the question ONLY using the provided context.
If the answer is not contained in the context, say "I don't know based on the provided documents."
Do NOT use any outside knowledge.
Do not mention the context blocks or their numbers in the answer.)";

std::string build_context_block(const std::vector<Passage> &passages) {
  std::ostringstream oss;
  for (size_t i = 0; i < passages.size(); ++i) {
    const auto &passage = passages[i];
    oss << "[" << (i + 1) << "] (doc_id=" << passage.chunk.document_id << ")\n"
        << passage.chunk.content;
    if (i + 1 < passages.size()) {
      oss << "\n\n";
    }
  }
  return oss.str();
}

}  // namespace

LlmSummarizer::LlmSummarizer(std::shared_ptr<TextGenerator> generator)
    : generator_(std::move(generator)) {
  if (!generator_) {
    throw InvalidConfigurationError("LlmSummarizer requires a text generator");
  }
}

std::string LlmSummarizer::build_prompt(const std::string &query,
                                        const std::vector<Passage> &passages,
                                        const SummaryBounds &bounds) {
  std::ostringstream prompt;
  prompt << kInstructions << "\n"
         << "Write between " << bounds.min_words << " and " << bounds.max_words
         << " words.\n\n"
         << "Context:\n"
         << build_context_block(passages) << "\n\n"
         << "Question:\n"
         << query << "\n\n"
         << "Answer:\n";
  return prompt.str();
}

std::string LlmSummarizer::summarize(const std::string &query,
                                     const std::vector<Passage> &passages,
                                     const SummaryBounds &bounds) {
  GenerationOptions options;
  // roughly two tokens per English word leaves room to finish the last sentence
  options.max_tokens = static_cast<int>(bounds.max_words * 2);
  options.temperature = 0.0f;

  std::string answer = text::trim(generator_->generate(build_prompt(query, passages, bounds), options));
  if (answer.empty()) {
    throw ModelError("Generation model returned an empty answer");
  }
  return answer;
}

}  // namespace sage_core
