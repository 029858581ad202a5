#include "docqa_core/services/context_assembler.hpp"

#include <utf8.h>

#include <algorithm>
#include <set>

namespace docqa_core {

ContextBlock ContextAssembler::block_from(const Chunk &chunk) {
  ContextBlock block;
  block.source_path = chunk.source_path;
  block.section_heading = chunk.section_heading;
  block.start_offset = chunk.start_offset;
  block.end_offset = chunk.end_offset;
  block.text = chunk.text;
  block.chunk_ids.push_back(chunk.id);
  return block;
}

bool ContextAssembler::merge_adjacent(std::vector<ContextBlock> &blocks, const Chunk &chunk) {
  for (size_t i = 0; i < blocks.size(); ++i) {
    ContextBlock &block = blocks[i];
    if (block.source_path != chunk.source_path) {
      continue;
    }
    if (block.start_offset <= chunk.start_offset && chunk.end_offset <= block.end_offset) {
      // Already covered
      return true;
    }
    if (block.end_offset == chunk.start_offset) {
      block.text += chunk.text;
      block.end_offset = chunk.end_offset;
      block.chunk_ids.push_back(chunk.id);
    } else if (chunk.end_offset == block.start_offset) {
      block.text = chunk.text + block.text;
      block.start_offset = chunk.start_offset;
      block.section_heading = chunk.section_heading;
      block.chunk_ids.insert(block.chunk_ids.begin(), chunk.id);
    } else {
      continue;
    }

    // The chunk may have bridged the gap to a later block of the same document
    for (size_t j = i + 1; j < blocks.size(); ++j) {
      ContextBlock &other = blocks[j];
      if (other.source_path != block.source_path) {
        continue;
      }
      if (other.start_offset == block.end_offset) {
        block.text += other.text;
        block.end_offset = other.end_offset;
        block.chunk_ids.insert(block.chunk_ids.end(), other.chunk_ids.begin(),
                               other.chunk_ids.end());
      } else if (other.end_offset == block.start_offset) {
        block.text = other.text + block.text;
        block.start_offset = other.start_offset;
        block.section_heading = other.section_heading;
        block.chunk_ids.insert(block.chunk_ids.begin(), other.chunk_ids.begin(),
                               other.chunk_ids.end());
      } else {
        continue;
      }
      blocks.erase(blocks.begin() + static_cast<std::ptrdiff_t>(j));
      break;
    }
    return true;
  }
  return false;
}

std::string ContextAssembler::render_header(const ContextBlock &block) {
  if (block.section_heading.empty()) {
    return "[" + block.source_path + "]\n";
  }
  return "[" + block.source_path + " § " + block.section_heading + "]\n";
}

std::string ContextAssembler::render(const std::vector<ContextBlock> &blocks) {
  std::string text;
  for (size_t i = 0; i < blocks.size(); ++i) {
    if (i > 0) {
      text += BLOCK_SEPARATOR;
    }
    text += render_header(blocks[i]);
    text += blocks[i].text;
  }
  return text;
}

std::string ContextAssembler::truncate_utf8(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  auto it = text.begin();
  auto last_fit = text.begin();
  const auto end = text.end();
  while (it != end) {
    utf8::next(it, end);
    if (static_cast<size_t>(it - text.begin()) > max_bytes) {
      break;
    }
    last_fit = it;
  }
  return std::string(text.begin(), last_fit);
}

AssembledContext ContextAssembler::assemble(const std::vector<RetrievedChunk> &ranked,
                                            size_t budget_chars) const {
  AssembledContext context;
  if (ranked.empty() || budget_chars == 0) {
    return context;
  }

  // 1. Is the budget tight? Measure the ranked list with every adjacent merge applied.
  std::vector<ContextBlock> everything;
  for (const RetrievedChunk &retrieved : ranked) {
    if (retrieved.chunk.text.empty()) {
      continue;
    }
    if (!merge_adjacent(everything, retrieved.chunk)) {
      everything.push_back(block_from(retrieved.chunk));
    }
  }
  const bool tight = render(everything).size() > budget_chars;

  // 2. Take a prefix of the ranking that fits
  std::vector<ContextBlock> selected;
  std::set<std::string> represented;
  for (const RetrievedChunk &retrieved : ranked) {
    const Chunk &chunk = retrieved.chunk;
    // Nothing to ground an answer on, and nothing to cite
    if (chunk.text.empty()) {
      continue;
    }
    std::vector<ContextBlock> trial = selected;
    if (!merge_adjacent(trial, chunk)) {
      if (tight && represented.count(chunk.source_path) > 0) {
        continue;
      }
      trial.push_back(block_from(chunk));
    }

    if (render(trial).size() <= budget_chars) {
      selected = std::move(trial);
      represented.insert(chunk.source_path);
      continue;
    }

    if (selected.empty()) {
      // A block whose text cannot get a single character past its header is not selected
      ContextBlock first = block_from(chunk);
      const size_t header_size = render_header(first).size();
      if (budget_chars > header_size) {
        first.text = truncate_utf8(first.text, budget_chars - header_size);
      } else {
        first.text.clear();
      }
      if (!first.text.empty()) {
        first.end_offset = first.start_offset + first.text.size();
        selected.push_back(std::move(first));
      }
    }
    break;
  }

  context.text = truncate_utf8(render(selected), budget_chars);
  for (const ContextBlock &block : selected) {
    context.chunk_ids.insert(context.chunk_ids.end(), block.chunk_ids.begin(),
                             block.chunk_ids.end());
  }
  context.blocks = std::move(selected);
  return context;
}

}  // namespace docqa_core
