#pragma once
#include <faiss/IndexFlat.h>

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct SearchHit {
  size_t row;
  std::string chunk_id;
  float score;
};

/**
 * @class VectorIndex
 * @brief Immutable exact cosine-similarity index over chunk embeddings.
 *
 * Rows are stored in chunk order; row order is the canonical chunk id order.
 * The chunk records (without their embeddings) are the metadata sidecar.
 * Once constructed, an index is only ever read, so it can be shared between
 * any number of concurrent queries.
 */
class VectorIndex {
 public:
  // Builds from chunks that all carry embeddings of the same dimension.
  static std::shared_ptr<const VectorIndex> from_chunks(std::vector<Chunk> chunks,
                                                        std::string embedding_model = "");

  // Adopts an already-populated faiss index (used when loading from disk).
  VectorIndex(std::unique_ptr<faiss::IndexFlatIP> index,
              std::vector<Chunk> metadata,
              std::string embedding_model);

  // An empty index of unknown dimension
  VectorIndex() = default;

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  std::vector<SearchHit> search(const std::vector<float> &query_vector, int k) const;

  size_t size() const {
    return metadata_.size();
  }
  bool empty() const {
    return metadata_.empty();
  }
  int dimension() const {
    return index_ ? static_cast<int>(index_->d) : 0;
  }
  const Chunk &chunk_at(size_t row) const {
    return metadata_.at(row);
  }
  const std::vector<Chunk> &chunks() const {
    return metadata_;
  }
  const std::string &embedding_model() const {
    return embedding_model_;
  }
  const faiss::IndexFlatIP *faiss_index() const {
    return index_.get();
  }

  static void normalize(std::vector<float> &vector);

 private:
  std::unique_ptr<faiss::IndexFlatIP> index_;
  std::vector<Chunk> metadata_;
  std::string embedding_model_;
};

}  // namespace docqa_core
