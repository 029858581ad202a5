#include "docqa_core/chunking/chunker.hpp"

#include <utf8.h>

#include <algorithm>
#include <stdexcept>

namespace docqa_core {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\n' || c == '\t';
}

bool is_sentence_end(char c) {
  return c == '.' || c == '!' || c == '?' || c == ':';
}

}  // namespace

Chunker::Chunker(ChunkerOptions options) : options_(options) {
  if (options_.max_chars == 0) {
    throw std::invalid_argument("Chunker max_chars must be greater than 0");
  }
  if (options_.min_split_chars >= options_.max_chars) {
    throw std::invalid_argument("Chunker min_split_chars must be smaller than max_chars");
  }
}

ChunkSequence Chunker::chunk(const Document& document) const {
  return ChunkSequence(document, options_);
}

std::vector<Chunk> Chunker::chunk_all(const Document& document) const {
  std::vector<Chunk> chunks;
  for (const Chunk& chunk : chunk(document)) {
    chunks.push_back(chunk);
  }
  return chunks;
}

ChunkSequence::ChunkSequence(const Document& document, ChunkerOptions options)
    : document_(&document), options_(options) {
  const std::string& text = document.text;

  // Every heading opens a section; text before the first heading is a preamble
  size_t cursor = 0;
  std::string current_heading;
  size_t current_heading_end = 0;
  for (const Heading& heading : document.headings) {
    if (heading.offset > cursor) {
      sections_.push_back({cursor, heading.offset, current_heading_end, current_heading});
    }
    cursor = heading.offset;
    current_heading = heading.title;
    current_heading_end = std::min(text.size(), heading.offset + heading.length + 1);
  }
  if (cursor < text.size() || sections_.empty()) {
    sections_.push_back({cursor, text.size(), current_heading_end, current_heading});
  }
}

std::optional<Chunk> ChunkSequence::chunk_at(size_t position, int ordinal) const {
  const std::string& text = document_->text;
  // An empty document still yields one (empty) chunk
  if (position >= text.size() && !(text.empty() && ordinal == 0)) {
    return std::nullopt;
  }

  auto section = std::find_if(sections_.begin(), sections_.end(), [&](const Section& s) {
    return position >= s.start && (position < s.end || s.start == s.end);
  });
  if (section == sections_.end()) {
    return std::nullopt;
  }

  size_t cut = find_cut(position, *section);

  Chunk chunk;
  chunk.id = make_chunk_id(document_->source_path, ordinal);
  chunk.source_path = document_->source_path;
  chunk.section_heading = section->heading;
  chunk.text = text.substr(position, cut - position);
  chunk.start_offset = position;
  chunk.end_offset = cut;
  chunk.ordinal = ordinal;
  return chunk;
}

size_t ChunkSequence::find_cut(size_t position, const Section& section) const {
  const std::string& text = document_->text;
  if (section.end - position <= options_.max_chars) {
    return section.end;
  }

  // Never cut inside the heading line that opens the section
  const size_t floor = std::max(position + 1, section.heading_end);
  const size_t window_end = position + options_.max_chars;
  if (floor >= window_end) {
    return std::min(section.end, std::max(floor, position + 1));
  }
  const size_t preferred_floor = std::max(floor, position + options_.min_split_chars);

  // 1. paragraph break
  for (size_t i = window_end; i >= preferred_floor + 2; --i) {
    if (text[i - 1] == '\n' && text[i - 2] == '\n') {
      return i;
    }
  }
  // 2. sentence end followed by whitespace
  for (size_t i = window_end; i >= preferred_floor + 2; --i) {
    if (is_space(text[i - 1]) && is_sentence_end(text[i - 2])) {
      return i;
    }
  }
  // 3. any whitespace
  for (size_t i = window_end; i > floor; --i) {
    if (is_space(text[i - 1])) {
      return i;
    }
  }
  // 4. hard cut on a codepoint boundary
  auto it = text.begin() + static_cast<std::ptrdiff_t>(position);
  auto limit = text.begin() + static_cast<std::ptrdiff_t>(window_end);
  auto last_boundary = it;
  while (it < limit) {
    last_boundary = it;
    utf8::next(it, text.end());
  }
  if (it == limit) {
    last_boundary = it;
  }
  size_t cut = static_cast<size_t>(last_boundary - text.begin());
  if (cut <= position) {
    cut = static_cast<size_t>(it - text.begin());
  }
  return cut;
}

ChunkSequence::iterator::iterator(const ChunkSequence* sequence) : sequence_(sequence) {
  current_ = sequence_->chunk_at(0, 0);
}

ChunkSequence::iterator& ChunkSequence::iterator::operator++() {
  if (!current_) {
    return *this;
  }
  position_ = current_->end_offset;
  ++ordinal_;
  if (position_ >= sequence_->document_->text.size()) {
    current_.reset();
  } else {
    current_ = sequence_->chunk_at(position_, ordinal_);
  }
  return *this;
}

}  // namespace docqa_core
