#include "sage_core/services/compression_service.hpp"

#include <zstd.h>

#include "sage_core/errors.hpp"

namespace sage_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }
  std::vector<char> compressed_buffer(ZSTD_compressBound(data.size()));

  size_t const compressed_size = ZSTD_compress(compressed_buffer.data(), compressed_buffer.size(),
                                               data.data(), data.size(), compression_level);
  if (ZSTD_isError(compressed_size)) {
    throw PersistenceError("ZSTD compression failed: " +
                           std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed_buffer.resize(compressed_size);
  return compressed_buffer;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  unsigned long long const content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw PersistenceError("Stored chunk is not a zstd frame with a known content size");
  }

  std::string decompressed(content_size, '\0');
  size_t const actual_size = ZSTD_decompress(decompressed.data(), decompressed.size(),
                                             compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual_size)) {
    throw PersistenceError("ZSTD decompression failed: " +
                           std::string(ZSTD_getErrorName(actual_size)));
  }
  if (actual_size != content_size) {
    throw PersistenceError("ZSTD decompression produced " + std::to_string(actual_size) +
                           " bytes, frame header announced " + std::to_string(content_size));
  }
  return decompressed;
}

}  // namespace sage_core
