#include <iomanip>
#include <sstream>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

std::string make_chunk_id(const std::string& source_path, int ordinal) {
  std::stringstream ss;
  ss << source_path << '#' << std::setw(5) << std::setfill('0') << ordinal;
  return ss.str();
}

}  // namespace docqa_core
