#include "docqa_core/index/vector_index.hpp"

#include <algorithm>
#include <cmath>

namespace docqa_core {

void VectorIndex::normalize(std::vector<float> &vector) {
  float norm = 0.0f;
  for (float val : vector) {
    norm += val * val;
  }
  norm = std::sqrt(norm);
  if (norm > 0.0f) {
    for (float &val : vector) {
      val /= norm;
    }
  }
}

std::shared_ptr<const VectorIndex> VectorIndex::from_chunks(std::vector<Chunk> chunks,
                                                            std::string embedding_model) {
  if (chunks.empty()) {
    return std::make_shared<const VectorIndex>();
  }

  const size_t dimension = chunks.front().vector_embedding.size();
  if (dimension == 0) {
    throw VectorIndexError("Cannot build an index from chunks without embeddings");
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(chunks.size() * dimension);
  for (auto &chunk : chunks) {
    if (chunk.vector_embedding.size() != dimension) {
      throw VectorIndexError("Vector embedding size mismatch for chunk " + chunk.id +
                             ". Expected " + std::to_string(dimension) + " dimensions, got " +
                             std::to_string(chunk.vector_embedding.size()) + ".");
    }
    std::vector<float> normalized = chunk.vector_embedding;
    normalize(normalized);
    all_vectors_flat.insert(all_vectors_flat.end(), normalized.begin(), normalized.end());
    // The faiss rows are the single copy of the vectors
    chunk.vector_embedding.clear();
    chunk.vector_embedding.shrink_to_fit();
  }

  auto index = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension));
  index->add(static_cast<faiss::idx_t>(chunks.size()), all_vectors_flat.data());
  return std::make_shared<const VectorIndex>(std::move(index), std::move(chunks),
                                             std::move(embedding_model));
}

VectorIndex::VectorIndex(std::unique_ptr<faiss::IndexFlatIP> index,
                         std::vector<Chunk> metadata,
                         std::string embedding_model)
    : index_(std::move(index)),
      metadata_(std::move(metadata)),
      embedding_model_(std::move(embedding_model)) {
  const faiss::idx_t stored = index_ ? index_->ntotal : 0;
  if (stored != static_cast<faiss::idx_t>(metadata_.size())) {
    throw VectorIndexError("Index holds " + std::to_string(stored) + " vectors but " +
                           std::to_string(metadata_.size()) + " metadata rows");
  }
}

std::vector<SearchHit> VectorIndex::search(const std::vector<float> &query_vector, int k) const {
  if (!index_ || index_->ntotal == 0 || k <= 0) {
    return {};
  }
  if (query_vector.size() != static_cast<size_t>(index_->d)) {
    throw VectorIndexError("Query vector dimension mismatch. Expected " +
                           std::to_string(index_->d) + ", got " +
                           std::to_string(query_vector.size()));
  }

  std::vector<float> query = query_vector;
  normalize(query);

  const faiss::idx_t total = index_->ntotal;
  const faiss::idx_t actual_k = std::min<faiss::idx_t>(k, total);

  // faiss does not order equal scores, so widen the probe until every row tied
  // with the k-th score is inside it; the sort below then breaks ties by chunk id.
  faiss::idx_t probe = std::min<faiss::idx_t>(actual_k + 1, total);
  std::vector<float> distances;
  std::vector<faiss::idx_t> labels;
  while (true) {
    distances.assign(probe, 0.0f);
    labels.assign(probe, -1);
    index_->search(1, query.data(), probe, distances.data(), labels.data());
    if (probe == total || distances[probe - 1] < distances[actual_k - 1]) {
      break;
    }
    probe = std::min<faiss::idx_t>(probe * 2, total);
  }

  std::vector<SearchHit> hits;
  hits.reserve(probe);
  for (faiss::idx_t i = 0; i < probe; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    size_t row = static_cast<size_t>(labels[i]);
    hits.push_back({row, metadata_[row].id, distances[i]});
  }
  std::sort(hits.begin(), hits.end(), [](const SearchHit &a, const SearchHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.chunk_id < b.chunk_id;
  });
  if (hits.size() > static_cast<size_t>(actual_k)) {
    hits.resize(actual_k);
  }
  return hits;
}

}  // namespace docqa_core
