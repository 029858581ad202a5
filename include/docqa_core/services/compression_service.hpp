#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docqa_core {

// Chunk text is stored zstd-compressed in the metadata sidecar.
class CompressionService {
 public:
  /**
   * @brief Compresses a block of text using Zstandard.
   * @param data The text to compress.
   * @param compression_level The zstd compression level (default is 3).
   * @return The compressed frame; never empty, even for empty input.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = 3);

  /**
   * @brief Decompresses a Zstandard frame produced by compress().
   * @throw std::runtime_error if the data is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char>& compressed_data);
};

}  // namespace docqa_core
