#include "docqa_core/services/compression_service.hpp"

#include <zstd.h>

#include <stdexcept>

namespace docqa_core {

// Empty input still gets a complete frame, so a stored blob is never zero-length
std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  std::vector<char> compressed_buffer(ZSTD_compressBound(data.size()));

  size_t const compressed_size = ZSTD_compress(compressed_buffer.data(), compressed_buffer.size(),
                                               data.data(), data.size(), compression_level);
  if (ZSTD_isError(compressed_size)) {
    throw std::runtime_error("ZSTD compression failed: " +
                             std::string(ZSTD_getErrorName(compressed_size)));
  }

  compressed_buffer.resize(compressed_size);
  return compressed_buffer;
}

std::string CompressionService::decompress(const std::vector<char>& compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  unsigned long long const content_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR || content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw std::runtime_error("Failed to get decompressed size or data is not zstd format.");
  }

  std::string decompressed(content_size, '\0');
  size_t const actual_size = ZSTD_decompress(decompressed.data(), decompressed.size(),
                                             compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual_size)) {
    throw std::runtime_error("ZSTD decompression failed: " +
                             std::string(ZSTD_getErrorName(actual_size)));
  }
  if (actual_size != content_size) {
    throw std::runtime_error("ZSTD decompression produced a truncated frame");
  }
  return decompressed;
}

}  // namespace docqa_core
