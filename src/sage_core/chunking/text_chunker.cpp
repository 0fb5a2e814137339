#include "sage_core/chunking/text_chunker.hpp"

#include <utf8.h>

#include <algorithm>

#include "sage_core/errors.hpp"

namespace sage_core {

TextChunker::TextChunker(ChunkingPolicy policy) : policy_(policy) {
  validate(policy_.chunk_size, policy_.overlap);
}

void TextChunker::validate(size_t size, size_t overlap) {
  if (size == 0) {
    throw InvalidConfigurationError("Chunk size must be greater than 0");
  }
  if (overlap >= size) {
    throw InvalidConfigurationError("Chunk overlap (" + std::to_string(overlap) +
                                    ") must be smaller than chunk size (" +
                                    std::to_string(size) + ")");
  }
}

std::vector<std::string> TextChunker::split(const std::string& text) const {
  return chunk(text, policy_.chunk_size, policy_.overlap);
}

std::vector<std::string> TextChunker::chunk(const std::string& text, size_t size, size_t overlap) {
  validate(size, overlap);

  std::vector<std::string> out;
  if (text.empty())
    return out;

  if (!utf8::is_valid(text.begin(), text.end())) {
    throw InvalidArgumentError("Document text is not valid UTF-8");
  }

  // Byte offset of every code point, plus the end of the text.
  std::vector<size_t> boundaries;
  boundaries.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    boundaries.push_back(static_cast<size_t>(it - text.begin()));
  }
  boundaries.push_back(text.size());

  const size_t length = boundaries.size() - 1;
  const size_t step = size - overlap;

  for (size_t start = 0;; start += step) {
    size_t end = std::min(start + size, length);
    out.emplace_back(text, boundaries[start], boundaries[end] - boundaries[start]);
    if (end == length)
      break;
  }

  return out;
}

}  // namespace sage_core
