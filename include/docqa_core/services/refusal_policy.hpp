#pragma once

#include <regex>
#include <string>
#include <vector>

#include "docqa_core/types/query.hpp"

namespace docqa_core {

struct RefusalPolicyOptions {
  float similarity_threshold = 0.35f;
  // Case-insensitive ECMAScript patterns, matched against the start of the answer
  std::vector<std::string> refusal_patterns;
  std::string refusal_message = "Not found in the documentation.";

  static std::vector<std::string> default_patterns();
};

/**
 * @class RefusalPolicy
 * @brief The two gates a query passes before an answer is released.
 *
 * Gate one runs before generation: no retrieval, or a top score below the
 * threshold, refuses with NO_RELEVANT_CONTEXT and generation is skipped.
 * Gate two runs on the generated text: a recognised "not found" phrasing, or
 * no text at all, refuses with MODEL_DETECTED_ABSENCE.
 */
class RefusalPolicy {
 public:
  // Throws std::invalid_argument on a malformed pattern.
  explicit RefusalPolicy(RefusalPolicyOptions options = {});

  // NONE when generation may proceed, NO_RELEVANT_CONTEXT otherwise.
  RefusalReason check_retrieval(const std::vector<RetrievedChunk> &retrieved,
                                float threshold) const;
  RefusalReason check_retrieval(const std::vector<RetrievedChunk> &retrieved) const {
    return check_retrieval(retrieved, options_.similarity_threshold);
  }

  // NONE when the text is an answer, MODEL_DETECTED_ABSENCE otherwise.
  RefusalReason check_generation(const std::string &generated) const;

  bool matches_refusal_pattern(const std::string &text) const;

  float similarity_threshold() const {
    return options_.similarity_threshold;
  }
  const std::string &refusal_message() const {
    return options_.refusal_message;
  }

 private:
  RefusalPolicyOptions options_;
  std::vector<std::regex> patterns_;
};

}  // namespace docqa_core
