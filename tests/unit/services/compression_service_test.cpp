#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "sage_core/errors.hpp"
#include "sage_core/services/compression_service.hpp"

namespace sage_core {

class CompressionServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    rng_.seed(42);
  }

  // Helper to generate printable noise, which zstd cannot shrink much
  std::string generate_random_data(size_t size) {
    std::string data(size, '\0');
    std::uniform_int_distribution<int> dist(32, 126);
    std::generate(data.begin(), data.end(), [this, &dist]() { return static_cast<char>(dist(rng_)); });
    return data;
  }

  // Helper to generate repetitive prose, the shape of most chunk text
  std::string generate_repetitive_data(size_t size) {
    std::string pattern = "Employees accrue twelve days of casual leave per year. ";
    std::string data;
    while (data.size() < size) {
      data += pattern;
    }
    return data.substr(0, size);
  }

  std::mt19937 rng_;
};

TEST_F(CompressionServiceTest, ChunkTextSurvivesStorage) {
  std::string chunk = "Casual leave: 12 days per year.\nSick leave: 8 days, \xE2\x82\xAC 0 deductions.";
  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(chunk)), chunk);
}

TEST_F(CompressionServiceTest, EmptyInputStaysEmpty) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_TRUE(CompressionService::decompress({}).empty());
}

TEST_F(CompressionServiceTest, DefaultCompressionLevelIsThree) {
  std::string test_data = generate_repetitive_data(3000);
  EXPECT_EQ(CompressionService::compress(test_data), CompressionService::compress(test_data, 3));
}

TEST_F(CompressionServiceTest, RepetitiveTextCompressesWell) {
  std::string repetitive_data = generate_repetitive_data(10000);
  std::vector<char> compressed = CompressionService::compress(repetitive_data);

  double compression_ratio = static_cast<double>(compressed.size()) / repetitive_data.size();
  EXPECT_LT(compression_ratio, 0.3) << "Repetitive text should compress well";
  EXPECT_EQ(CompressionService::decompress(compressed), repetitive_data);
}

TEST_F(CompressionServiceTest, RandomDataDoesNotExpandMuch) {
  std::string random_data = generate_random_data(20000);
  std::vector<char> compressed = CompressionService::compress(random_data);

  double compression_ratio = static_cast<double>(compressed.size()) / random_data.size();
  EXPECT_LT(compression_ratio, 1.1);
  EXPECT_EQ(CompressionService::decompress(compressed), random_data);
}

TEST_F(CompressionServiceTest, HigherLevelsStillRoundTrip) {
  std::string test_data = generate_repetitive_data(20000);
  for (int level : {1, 9, 19, 22}) {
    EXPECT_EQ(CompressionService::decompress(CompressionService::compress(test_data, level)),
              test_data)
        << "level " << level;
  }
}

TEST_F(CompressionServiceTest, Decompress_InvalidDataThrowsPersistenceError) {
  std::vector<char> invalid_data = {'H', 'e', 'l', 'l', 'o'};  // Not zstd compressed
  EXPECT_THROW(CompressionService::decompress(invalid_data), PersistenceError);
}

TEST_F(CompressionServiceTest, Decompress_CorruptedHeaderThrowsPersistenceError) {
  std::vector<char> compressed = CompressionService::compress("Test data for corruption test");
  ASSERT_GT(compressed.size(), 4u);
  // The magic number is what zstd checks first
  compressed[0] = static_cast<char>(0xFF);
  compressed[1] = static_cast<char>(0xFF);
  compressed[2] = static_cast<char>(0xFF);
  compressed[3] = static_cast<char>(0xFF);
  EXPECT_THROW(CompressionService::decompress(compressed), PersistenceError);
}

TEST_F(CompressionServiceTest, Decompress_TruncatedFrameThrowsPersistenceError) {
  std::vector<char> compressed = CompressionService::compress(generate_repetitive_data(5000));
  compressed.resize(compressed.size() / 2);
  EXPECT_THROW(CompressionService::decompress(compressed), PersistenceError);
}

}  // namespace sage_core
