#include "sage_core/synthesis/extractive_summarizer.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "sage_core/synthesis/synthesizer.hpp"
#include "sage_core/text/text_utils.hpp"

namespace sage_core {

namespace {

struct Candidate {
  size_t order;
  size_t score;
  size_t words;
};

size_t score_sentence(const std::string &sentence, const std::unordered_set<std::string> &query_terms) {
  std::unordered_set<std::string> matched;
  for (const auto &term : text::tokenize_terms(sentence)) {
    if (query_terms.count(term)) {
      matched.insert(term);
    }
  }
  return matched.size();
}

}  // namespace

std::vector<std::string> ExtractiveSummarizer::split_sentences(const std::string &text) {
  std::vector<std::string> sentences;
  std::string current;
  auto flush = [&]() {
    std::string sentence = text::trim(current);
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
    current.clear();
  };

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\n' || c == '\r') {
      flush();
      continue;
    }
    current += c;
    bool terminal = c == '.' || c == '!' || c == '?';
    bool at_boundary =
        i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1]));
    if (terminal && at_boundary) {
      flush();
    }
  }
  flush();
  return sentences;
}

std::string ExtractiveSummarizer::summarize(const std::string &query,
                                            const std::vector<Passage> &passages,
                                            const SummaryBounds &bounds) {
  std::vector<std::string> sentences = split_sentences(Synthesizer::build_context(passages));
  if (sentences.empty() || bounds.max_words == 0) {
    return "";
  }

  auto terms = text::tokenize_terms(query);
  std::unordered_set<std::string> query_terms(terms.begin(), terms.end());

  std::vector<Candidate> candidates;
  candidates.reserve(sentences.size());
  for (size_t i = 0; i < sentences.size(); ++i) {
    candidates.push_back({i, score_sentence(sentences[i], query_terms), text::count_words(sentences[i])});
  }
  std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate &a, const Candidate &b) {
    return a.score > b.score;
  });

  std::vector<size_t> picked;
  size_t total_words = 0;
  bool skipped_relevant = false;
  for (const auto &candidate : candidates) {
    if (total_words >= bounds.min_words && !picked.empty()) {
      break;
    }
    if (total_words + candidate.words > bounds.max_words) {
      // The best sentence alone is longer than the limit
      if (picked.empty()) {
        return text::truncate_words(sentences[candidate.order], bounds.max_words);
      }
      skipped_relevant = skipped_relevant || candidate.score > 0;
      continue;
    }
    // Candidates are ranked, so everything from here on matches no query term.
    if (candidate.score == 0 && skipped_relevant) {
      break;
    }
    picked.push_back(candidate.order);
    total_words += candidate.words;
  }

  std::sort(picked.begin(), picked.end());
  std::string answer;
  for (size_t order : picked) {
    if (!answer.empty()) {
      answer += ' ';
    }
    answer += sentences[order];
  }
  return answer;
}

}  // namespace sage_core
