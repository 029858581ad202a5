#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/query.hpp"

namespace docqa_core {

// One contiguous span of a source document inside the assembled context.
struct ContextBlock {
  std::string source_path;
  std::string section_heading;
  size_t start_offset = 0;
  size_t end_offset = 0;
  std::string text;
  std::vector<std::string> chunk_ids;  // in document order
};

struct AssembledContext {
  std::string text;
  // Contributing chunk ids in the order they appear in text
  std::vector<std::string> chunk_ids;
  std::vector<ContextBlock> blocks;

  bool empty() const {
    return chunk_ids.empty();
  }
};

/**
 * @class ContextAssembler
 * @brief Packs ranked chunks into a prompt context that never exceeds a budget.
 *
 * Chunks are taken in rank order. A chunk that touches an already selected
 * block of the same document is merged into it. When the whole ranked list
 * does not fit, the budget is "tight" and every further chunk from an already
 * represented document is dropped, so more documents get a say. Selection stops
 * at the first chunk that does not fit. The first block is truncated rather
 * than dropped, unless the budget cannot hold its header plus one character;
 * then the context is empty. Chunks without text are never selected.
 *
 * Sizes are measured in UTF-8 bytes, which never undercounts characters.
 */
class ContextAssembler {
 public:
  static constexpr const char *BLOCK_SEPARATOR = "\n\n";

  AssembledContext assemble(const std::vector<RetrievedChunk> &ranked, size_t budget_chars) const;

  static std::string render_header(const ContextBlock &block);
  static std::string render(const std::vector<ContextBlock> &blocks);

 private:
  // Merges `chunk` into a block it touches; returns false if none does.
  static bool merge_adjacent(std::vector<ContextBlock> &blocks, const Chunk &chunk);
  static ContextBlock block_from(const Chunk &chunk);
  static std::string truncate_utf8(const std::string &text, size_t max_bytes);
};

}  // namespace docqa_core
