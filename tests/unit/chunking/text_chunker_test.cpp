#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sage_core/chunking/text_chunker.hpp"
#include "sage_core/errors.hpp"

namespace sage_core {

namespace {

size_t expected_count(size_t length, size_t size, size_t overlap) {
  return (length - overlap + (size - overlap) - 1) / (size - overlap);
}

// Rebuilds the text from the non-overlapping prefix of every chunk but the last.
std::string reassemble(const std::vector<std::string>& chunks, size_t step) {
  std::string out;
  for (size_t i = 0; i < chunks.size(); ++i) {
    out += (i + 1 < chunks.size()) ? chunks[i].substr(0, step) : chunks[i];
  }
  return out;
}

}  // namespace

TEST(TextChunkerTest, EmptyTextYieldsNoChunks) {
  EXPECT_TRUE(TextChunker::chunk("", 10, 2).empty());
}

TEST(TextChunkerTest, ShortTextYieldsSingleChunk) {
  auto chunks = TextChunker::chunk("hello", 10, 2);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "hello");
}

TEST(TextChunkerTest, TextNoLongerThanOverlapStillYieldsOneChunk) {
  auto chunks = TextChunker::chunk("ab", 10, 5);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "ab");
}

TEST(TextChunkerTest, ExactWindowsWithOverlap) {
  auto chunks = TextChunker::chunk("abcdefghij", 4, 1);
  std::vector<std::string> expected = {"abcd", "defg", "ghij"};
  EXPECT_EQ(chunks, expected);
}

TEST(TextChunkerTest, LastWindowMayBeShorter) {
  auto chunks = TextChunker::chunk("abcdefghijk", 4, 1);
  std::vector<std::string> expected = {"abcd", "defg", "ghij", "jk"};
  EXPECT_EQ(chunks, expected);
}

TEST(TextChunkerTest, ChunkCountMatchesFormula) {
  struct Case {
    size_t length;
    size_t size;
    size_t overlap;
  };
  std::vector<Case> cases = {{1000, 400, 50}, {401, 400, 50}, {400, 400, 50},
                             {351, 400, 50},  {25, 10, 0},    {26, 10, 3}};

  for (const auto& c : cases) {
    std::string text(c.length, 'x');
    auto chunks = TextChunker::chunk(text, c.size, c.overlap);
    EXPECT_EQ(chunks.size(), expected_count(c.length, c.size, c.overlap))
        << "L=" << c.length << " s=" << c.size << " o=" << c.overlap;
    for (const auto& chunk : chunks) {
      EXPECT_LE(chunk.size(), c.size);
    }
  }
}

TEST(TextChunkerTest, ChunksReassembleToOriginal) {
  std::string text;
  for (int i = 0; i < 120; ++i) {
    text += "word" + std::to_string(i) + " ";
  }
  auto chunks = TextChunker::chunk(text, 64, 16);
  EXPECT_EQ(reassemble(chunks, 48), text);
}

TEST(TextChunkerTest, MultiByteCharactersAreNeverSplit) {
  // 6 code points, 2 bytes each
  std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";
  auto chunks = TextChunker::chunk(text, 4, 1);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].size(), 8u);
  EXPECT_EQ(chunks[1].size(), 6u);
}

TEST(TextChunkerTest, RejectsOverlapNotSmallerThanSize) {
  EXPECT_THROW(TextChunker::chunk("text", 4, 4), InvalidConfigurationError);
  EXPECT_THROW(TextChunker::chunk("text", 4, 9), InvalidConfigurationError);
  EXPECT_THROW(TextChunker::chunk("text", 0, 0), InvalidConfigurationError);
  EXPECT_THROW({ TextChunker chunker(ChunkingPolicy{10, 10}); }, InvalidConfigurationError);
}

TEST(TextChunkerTest, RejectsInvalidUtf8) {
  std::string text = "abc\xFF\xFE";
  EXPECT_THROW(TextChunker::chunk(text, 4, 1), InvalidArgumentError);
}

TEST(TextChunkerTest, SplitUsesConfiguredPolicy) {
  TextChunker chunker(ChunkingPolicy{5, 2});
  auto chunks = chunker.split("abcdefgh");
  std::vector<std::string> expected = {"abcde", "defgh"};
  EXPECT_EQ(chunks, expected);
}

TEST(TextChunkerTest, DefaultPolicy) {
  TextChunker chunker;
  EXPECT_EQ(chunker.policy().chunk_size, 400u);
  EXPECT_EQ(chunker.policy().overlap, 50u);
}

}  // namespace sage_core
