#include "sage_core/synthesis/synthesizer.hpp"

#include <utility>

#include "sage_core/errors.hpp"
#include "sage_core/text/text_utils.hpp"

namespace sage_core {

Synthesizer::Synthesizer(std::shared_ptr<Summarizer> summarizer, SynthesisPolicy policy)
    : summarizer_(std::move(summarizer)), policy_(policy) {
  if (!summarizer_) {
    throw InvalidConfigurationError("Synthesizer requires a summarizer");
  }
  if (policy_.snippet_chars == 0) {
    throw InvalidConfigurationError("snippet_chars must be greater than zero");
  }
  if (policy_.bounds.max_words == 0 || policy_.bounds.min_words > policy_.bounds.max_words) {
    throw InvalidConfigurationError("Answer word bounds must satisfy 0 <= min <= max and max > 0");
  }
}

std::string Synthesizer::build_context(const std::vector<Passage> &passages) {
  std::string context;
  for (size_t i = 0; i < passages.size(); ++i) {
    if (i > 0) {
      context += "\n\n";
    }
    context += passages[i].chunk.content;
  }
  return context;
}

std::vector<Source> Synthesizer::build_sources(const std::vector<Passage> &passages) const {
  std::vector<Source> sources;
  sources.reserve(passages.size());
  for (const auto &passage : passages) {
    sources.push_back(Source{passage.chunk.document_id,
                             text::truncate_chars(passage.chunk.content, policy_.snippet_chars)});
  }
  return sources;
}

Answer Synthesizer::synthesize(const std::string &query,
                               const std::vector<Passage> &passages) const {
  if (passages.empty()) {
    return Answer{NO_PASSAGES_ANSWER, {}};
  }

  std::string text = summarizer_->summarize(query, passages, policy_.bounds);
  if (text::count_words(text) > policy_.bounds.max_words) {
    text = text::truncate_words(text, policy_.bounds.max_words);
  }
  if (text::trim(text).empty()) {
    text = NO_PASSAGES_ANSWER;
  }
  return Answer{std::move(text), build_sources(passages)};
}

}  // namespace sage_core
