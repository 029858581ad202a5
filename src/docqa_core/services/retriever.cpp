#include "docqa_core/services/retriever.hpp"

#include <stdexcept>

#include "docqa_core/llm/gateways.hpp"

namespace docqa_core {

Retriever::Retriever(EmbeddingGateway &gateway) : gateway_(gateway) {}

std::vector<RetrievedChunk> Retriever::retrieve(const VectorIndex &index,
                                                const std::string &query,
                                                int k) const {
  if (k < 1) {
    throw std::invalid_argument("k must be at least 1");
  }
  if (index.empty()) {
    return {};
  }

  std::vector<float> query_embedding;
  try {
    query_embedding = gateway_.embed(query, EmbeddingRole::QUERY);
  } catch (const EmbeddingUnavailable &e) {
    throw RetrievalFailed("Query embedding failed: " + std::string(e.what()));
  }
  if (query_embedding.size() != static_cast<size_t>(index.dimension())) {
    throw RetrievalFailed("Query embedding has dimension " +
                          std::to_string(query_embedding.size()) + ", index expects " +
                          std::to_string(index.dimension()));
  }

  std::vector<SearchHit> hits;
  try {
    hits = index.search(query_embedding, k);
  } catch (const VectorIndexError &e) {
    throw RetrievalFailed("Search failed: " + std::string(e.what()));
  }

  std::vector<RetrievedChunk> results;
  results.reserve(hits.size());
  for (const SearchHit &hit : hits) {
    results.push_back({index.chunk_at(hit.row), hit.score});
  }
  return results;
}

}  // namespace docqa_core
