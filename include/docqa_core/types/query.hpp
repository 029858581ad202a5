#pragma once

#include <string>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

struct QueryOptions {
  int top_k = 3;
  float similarity_threshold = 0.35f;
  size_t context_budget_chars = 2000;
};

struct RetrievedChunk {
  Chunk chunk;
  float score = 0.0f;
};

enum class QueryOutcome { ANSWERED, REFUSED };

enum class RefusalReason {
  NONE,
  NO_RELEVANT_CONTEXT,
  MODEL_DETECTED_ABSENCE,
  EMPTY_INDEX,
  RETRIEVAL_FAILED,
  GENERATION_FAILED
};

inline std::string to_string(QueryOutcome outcome) {
  switch (outcome) {
    case QueryOutcome::ANSWERED:
      return "ANSWERED";
    case QueryOutcome::REFUSED:
      return "REFUSED";
    default:
      return "UNKNOWN";
  }
}

inline std::string to_string(RefusalReason reason) {
  switch (reason) {
    case RefusalReason::NONE:
      return "none";
    case RefusalReason::NO_RELEVANT_CONTEXT:
      return "no_relevant_context";
    case RefusalReason::MODEL_DETECTED_ABSENCE:
      return "model_detected_absence";
    case RefusalReason::EMPTY_INDEX:
      return "empty_index";
    case RefusalReason::RETRIEVAL_FAILED:
      return "retrieval_failed";
    case RefusalReason::GENERATION_FAILED:
      return "generation_failed";
    default:
      return "unknown";
  }
}

struct QueryResult {
  std::string answer;
  bool refused = true;
  RefusalReason reason = RefusalReason::NONE;
  std::vector<std::string> sources;
  std::vector<RetrievedChunk> retrieved;
  // Assembled context handed to the generator (empty when generation was skipped).
  std::string context;
  std::string error;

  QueryOutcome outcome() const {
    return refused ? QueryOutcome::REFUSED : QueryOutcome::ANSWERED;
  }
};

}  // namespace docqa_core
