#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "sage_core/errors.hpp"
#include "sage_core/synthesis/llm_summarizer.hpp"

namespace sage_core {

using sage_tests::MockTextGenerator;
using sage_tests::TestUtilities;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;

class LlmSummarizerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    generator_ = std::make_shared<MockTextGenerator>();
    passages_ = {TestUtilities::create_passage("hr1", "Casual leave: 12 days per year.", 0.2f, 0),
                 TestUtilities::create_passage("hr2", "Sick leave: 8 days per year.", 0.7f, 1)};
  }

  std::shared_ptr<MockTextGenerator> generator_;
  std::vector<Passage> passages_;
};

TEST_F(LlmSummarizerTest, PromptNumbersContextBlocksInRetrievalOrder) {
  SummaryBounds bounds{30, 130};
  std::string prompt = LlmSummarizer::build_prompt("How many casual leaves?", passages_, bounds);

  EXPECT_THAT(prompt, HasSubstr("[1] (doc_id=hr1)\nCasual leave: 12 days per year."));
  EXPECT_THAT(prompt, HasSubstr("[2] (doc_id=hr2)\nSick leave: 8 days per year."));
  EXPECT_LT(prompt.find("[1]"), prompt.find("[2]"));
  EXPECT_THAT(prompt, HasSubstr("Question:\nHow many casual leaves?"));
  EXPECT_THAT(prompt, HasSubstr("between 30 and 130 words"));
  EXPECT_THAT(prompt, HasSubstr("ONLY using the provided context"));
}

TEST_F(LlmSummarizerTest, GeneratesDeterministicallyWithTokenBudget) {
  EXPECT_CALL(*generator_, generate(HasSubstr("casual"), _))
      .WillOnce(testing::Invoke([](const std::string&, const GenerationOptions& options) {
        EXPECT_EQ(options.max_tokens, 200);
        EXPECT_FLOAT_EQ(options.temperature, 0.0f);
        return std::string("  Twelve days of casual leave per year.\n");
      }));
  LlmSummarizer summarizer(generator_);

  std::string answer = summarizer.summarize("How many casual leaves?", passages_, SummaryBounds{10, 100});
  EXPECT_EQ(answer, "Twelve days of casual leave per year.");
}

TEST_F(LlmSummarizerTest, EmptyGenerationIsModelFailure) {
  EXPECT_CALL(*generator_, generate(_, _)).WillOnce(Return("   "));
  LlmSummarizer summarizer(generator_);
  EXPECT_THROW(summarizer.summarize("q", passages_, SummaryBounds{}), ModelError);
}

TEST_F(LlmSummarizerTest, GeneratorErrorsPropagate) {
  EXPECT_CALL(*generator_, generate(_, _)).WillOnce(testing::Throw(ModelError("backend down")));
  LlmSummarizer summarizer(generator_);
  EXPECT_THROW(summarizer.summarize("q", passages_, SummaryBounds{}), ModelError);
}

TEST_F(LlmSummarizerTest, RequiresGenerator) {
  EXPECT_THROW({ LlmSummarizer summarizer(nullptr); }, InvalidConfigurationError);
}

}  // namespace sage_core
