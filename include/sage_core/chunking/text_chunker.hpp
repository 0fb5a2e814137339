#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sage_core {

struct ChunkingPolicy {
  size_t chunk_size = 400;
  size_t overlap = 50;
};

/**
 * @brief Fixed-window chunker with overlap.
 *
 * Sizes are measured in characters (UTF-8 code points); a multi-byte sequence is never
 * split across two chunks. Each window starts `chunk_size - overlap` characters after the
 * previous one and the last window may be shorter than `chunk_size`.
 */
class TextChunker {
 public:
  // Throws InvalidConfigurationError unless 0 <= overlap < chunk_size.
  explicit TextChunker(ChunkingPolicy policy = {});

  // Splits `text` using the configured policy.
  std::vector<std::string> split(const std::string& text) const;

  const ChunkingPolicy& policy() const {
    return policy_;
  }

  /**
   * @brief Splits `text` into windows of `size` characters advancing by `size - overlap`.
   * @return zero chunks for empty text, at least one chunk otherwise.
   * @throws InvalidConfigurationError if overlap >= size or size == 0.
   * @throws InvalidArgumentError if `text` is not valid UTF-8.
   */
  static std::vector<std::string> chunk(const std::string& text, size_t size, size_t overlap);

 private:
  static void validate(size_t size, size_t overlap);

  ChunkingPolicy policy_;
};

}  // namespace sage_core
