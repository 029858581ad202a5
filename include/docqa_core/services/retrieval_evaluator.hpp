#pragma once

#include <string>
#include <vector>

#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/services/retriever.hpp"

namespace docqa_core {

// A question together with the documents that answer it.
struct EvaluationCase {
  std::string question;
  std::vector<std::string> relevant_sources;
};

struct EvaluationCaseResult {
  std::string question;
  bool hit = false;
  // Source paths of the top-k chunks, in search order
  std::vector<std::string> retrieved_sources;
};

struct EvaluationReport {
  int k = 0;
  size_t hits = 0;
  std::vector<EvaluationCaseResult> cases;

  double recall() const {
    return cases.empty() ? 0.0 : static_cast<double>(hits) / static_cast<double>(cases.size());
  }
};

/**
 * @class RetrievalEvaluator
 * @brief Measures retrieval quality against a ground-truth question set.
 *
 * A case is a hit when at least one of its top-k retrieved chunks comes from a
 * relevant document. recall() is the share of cases that hit.
 */
class RetrievalEvaluator {
 public:
  explicit RetrievalEvaluator(EmbeddingGateway &gateway);

  // True when any of the first k retrieved ids is relevant.
  static bool recall_at_k(const std::vector<std::string> &retrieved_ids,
                          const std::vector<std::string> &relevant_ids,
                          int k);

  // Throws std::invalid_argument for k < 1 or a case without relevant sources.
  // A retrieval failure propagates as RetrievalFailed.
  EvaluationReport evaluate(const VectorIndex &index,
                            const std::vector<EvaluationCase> &cases,
                            int k) const;

 private:
  Retriever retriever_;
};

}  // namespace docqa_core
