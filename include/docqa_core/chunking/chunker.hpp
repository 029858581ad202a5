#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"
#include "docqa_core/types/document.hpp"

namespace docqa_core {

struct ChunkerOptions {
  // --- Character goals (≈ 512 tokens at 3 chars per token) ---
  size_t max_chars = 1500;
  // Split points closer than this to the chunk start are only used as a last resort
  size_t min_split_chars = 200;
};

class Chunker;

/**
 * @class ChunkSequence
 * @brief Lazy, restartable view over the chunks of one document.
 *
 * Chunks are computed on demand while iterating; calling begin() again restarts
 * from the first chunk. The sequence references the document, which must
 * outlive it.
 */
class ChunkSequence {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Chunk;
    using difference_type = std::ptrdiff_t;
    using pointer = const Chunk*;
    using reference = const Chunk&;

    iterator() = default;

    reference operator*() const {
      return *current_;
    }
    pointer operator->() const {
      return &*current_;
    }
    iterator& operator++();
    iterator operator++(int) {
      iterator copy = *this;
      ++*this;
      return copy;
    }
    bool operator==(const iterator& other) const {
      return current_.has_value() == other.current_.has_value() &&
             (!current_ || position_ == other.position_);
    }
    bool operator!=(const iterator& other) const {
      return !(*this == other);
    }

   private:
    friend class ChunkSequence;
    explicit iterator(const ChunkSequence* sequence);

    const ChunkSequence* sequence_ = nullptr;
    size_t position_ = 0;
    int ordinal_ = 0;
    std::optional<Chunk> current_;
  };

  iterator begin() const {
    return iterator(this);
  }
  iterator end() const {
    return iterator();
  }

 private:
  friend class Chunker;
  struct Section {
    size_t start;
    size_t end;
    size_t heading_end;  // first offset a split may land on
    std::string heading;
  };

  ChunkSequence(const Document& document, ChunkerOptions options);

  // Produces the chunk starting at `position`, or nullopt once the document is exhausted.
  std::optional<Chunk> chunk_at(size_t position, int ordinal) const;
  size_t find_cut(size_t position, const Section& section) const;

  const Document* document_;
  ChunkerOptions options_;
  std::vector<Section> sections_;
};

class Chunker {
 public:
  explicit Chunker(ChunkerOptions options = {});

  ChunkSequence chunk(const Document& document) const;

  // Materialises the whole sequence
  std::vector<Chunk> chunk_all(const Document& document) const;

  const ChunkerOptions& options() const {
    return options_;
  }

 private:
  ChunkerOptions options_;
};

}  // namespace docqa_core
