#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sage_core {

// Chunk text is stored zstd-compressed in the corpus database.
class CompressionService {
 public:
  /**
   * @brief Compresses a block of data using Zstandard.
   * @param data The data to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame; empty for empty input.
   * @throws PersistenceError if zstd reports an error.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a single Zstandard frame.
   * @throws PersistenceError if the data is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace sage_core
