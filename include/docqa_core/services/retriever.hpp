#pragma once

#include <string>
#include <vector>

#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/types/query.hpp"

namespace docqa_core {

class EmbeddingGateway;

class RetrievalFailed : public std::exception {
 public:
  explicit RetrievalFailed(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class Retriever {
 public:
  explicit Retriever(EmbeddingGateway &gateway);

  // Embeds the query with role=query and returns the top-k chunks in search order.
  // An empty index yields no results and no embedding call.
  std::vector<RetrievedChunk> retrieve(const VectorIndex &index,
                                       const std::string &query,
                                       int k) const;

 private:
  EmbeddingGateway &gateway_;
};

}  // namespace docqa_core
