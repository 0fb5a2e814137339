#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "sage_core/synthesis/extractive_summarizer.hpp"
#include "sage_core/text/text_utils.hpp"

namespace sage_core {

using sage_tests::TestUtilities;

class ExtractiveSummarizerTest : public ::testing::Test {
 protected:
  ExtractiveSummarizer summarizer_;
  SummaryBounds bounds_;
};

TEST_F(ExtractiveSummarizerTest, SplitsSentencesOnPunctuationAndLines) {
  auto sentences = ExtractiveSummarizer::split_sentences(
      "First one. Second one? Third!\nFourth line without stop\n\nv1.2 stays whole.");
  std::vector<std::string> expected = {"First one.", "Second one?", "Third!",
                                       "Fourth line without stop", "v1.2 stays whole."};
  EXPECT_EQ(sentences, expected);
}

TEST_F(ExtractiveSummarizerTest, PrefersSentencesSharingQueryTerms) {
  bounds_.min_words = 1;
  bounds_.max_words = 20;
  std::vector<Passage> passages = {
      TestUtilities::create_passage("hr", "Offices open at nine. Casual leave: 12 days per year.")};

  std::string answer = summarizer_.summarize("How many casual leaves?", passages, bounds_);
  EXPECT_EQ(answer, "Casual leave: 12 days per year.");
}

TEST_F(ExtractiveSummarizerTest, KeepsOriginalOrderWhenAddingSentences) {
  bounds_.min_words = 10;
  bounds_.max_words = 40;
  std::vector<Passage> passages = {
      TestUtilities::create_passage("a", "Parking is free for staff."),
      TestUtilities::create_passage("b", "Sick leave needs a note. Casual leave is 12 days.")};

  std::string answer = summarizer_.summarize("casual leave", passages, bounds_);
  // "Casual leave" ranks first but appears last in the context
  EXPECT_EQ(answer, "Sick leave needs a note. Casual leave is 12 days.");
}

TEST_F(ExtractiveSummarizerTest, NeverExceedsMaxWords) {
  bounds_.min_words = 30;
  bounds_.max_words = 12;
  std::vector<Passage> passages = {TestUtilities::create_passage(
      "a", TestUtilities::repeat_words("leave", 25) + ". Short leave rule.")};

  std::string answer = summarizer_.summarize("leave", passages, bounds_);
  EXPECT_LE(text::count_words(answer), 12u);
  EXPECT_FALSE(answer.empty());
}

TEST_F(ExtractiveSummarizerTest, CutsSingleOverlongSentence) {
  bounds_.min_words = 1;
  bounds_.max_words = 5;
  std::vector<Passage> passages = {
      TestUtilities::create_passage("a", TestUtilities::repeat_words("policy", 50) + ".")};

  std::string answer = summarizer_.summarize("policy", passages, bounds_);
  EXPECT_EQ(text::count_words(answer), 5u);
}

TEST_F(ExtractiveSummarizerTest, OverlongRelevantSentenceBeatsShortUnrelatedOne) {
  bounds_.min_words = 1;
  bounds_.max_words = 10;
  std::vector<Passage> passages = {TestUtilities::create_passage(
      "hr",
      "Casual leave is twelve days per year for every permanent employee in the company. "
      "Parking is free.")};

  std::string answer = summarizer_.summarize("How many casual leave days?", passages, bounds_);
  EXPECT_EQ(answer, "Casual leave is twelve days per year for every permanent");
}

TEST_F(ExtractiveSummarizerTest, DoesNotFillWithUnrelatedSentencesAfterSkippingRelevantOne) {
  bounds_.min_words = 8;
  bounds_.max_words = 8;
  std::vector<Passage> passages = {TestUtilities::create_passage(
      "hr",
      "Casual leave is twelve days. Casual leave requests need manager approval first always. "
      "Parking is free.")};

  std::string answer = summarizer_.summarize("casual leave", passages, bounds_);
  EXPECT_EQ(answer, "Casual leave is twelve days.");
}

TEST_F(ExtractiveSummarizerTest, EmptyContextGivesEmptyAnswer) {
  EXPECT_EQ(summarizer_.summarize("q", {}, bounds_), "");
}

}  // namespace sage_core
