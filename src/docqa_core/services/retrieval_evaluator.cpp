#include "docqa_core/services/retrieval_evaluator.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace docqa_core {

RetrievalEvaluator::RetrievalEvaluator(EmbeddingGateway &gateway) : retriever_(gateway) {}

bool RetrievalEvaluator::recall_at_k(const std::vector<std::string> &retrieved_ids,
                                     const std::vector<std::string> &relevant_ids,
                                     int k) {
  if (k < 1) {
    throw std::invalid_argument("k must be at least 1");
  }
  std::unordered_set<std::string> relevant(relevant_ids.begin(), relevant_ids.end());
  size_t limit = std::min(retrieved_ids.size(), static_cast<size_t>(k));
  for (size_t i = 0; i < limit; ++i) {
    if (relevant.count(retrieved_ids[i]) > 0) {
      return true;
    }
  }
  return false;
}

EvaluationReport RetrievalEvaluator::evaluate(const VectorIndex &index,
                                              const std::vector<EvaluationCase> &cases,
                                              int k) const {
  if (k < 1) {
    throw std::invalid_argument("k must be at least 1");
  }

  EvaluationReport report;
  report.k = k;
  for (const EvaluationCase &evaluation_case : cases) {
    if (evaluation_case.relevant_sources.empty()) {
      throw std::invalid_argument("Evaluation case has no relevant sources: " +
                                  evaluation_case.question);
    }

    EvaluationCaseResult result;
    result.question = evaluation_case.question;
    for (const RetrievedChunk &retrieved : retriever_.retrieve(index, evaluation_case.question, k)) {
      result.retrieved_sources.push_back(retrieved.chunk.source_path);
    }
    result.hit = recall_at_k(result.retrieved_sources, evaluation_case.relevant_sources, k);
    if (result.hit) {
      ++report.hits;
    }
    report.cases.push_back(std::move(result));
  }

  std::ostringstream recall;
  recall << std::fixed << std::setprecision(3) << report.recall();
  std::cout << "RetrievalEvaluator: recall@" << k << " = " << recall.str() << " (" << report.hits
            << "/" << report.cases.size() << ")" << std::endl;
  return report;
}

}  // namespace docqa_core
