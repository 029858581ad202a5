#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace docqa_core {

// A contiguous passage of one cleaned source document.
struct Chunk {
  std::string id;
  std::string source_path;
  std::string section_heading;
  std::string text;
  size_t start_offset = 0;
  size_t end_offset = 0;
  int ordinal = 0;
  std::vector<float> vector_embedding;
};

// Stable chunk id: "<source_path>#<zero padded ordinal>". The padding keeps the
// lexical order of ids equal to the intra-document order.
std::string make_chunk_id(const std::string& source_path, int ordinal);

}  // namespace docqa_core
