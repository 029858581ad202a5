#include "docqa_core/services/refusal_policy.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace docqa_core {

std::vector<std::string> RefusalPolicyOptions::default_patterns() {
  return {
      R"(^\W*not (found|mentioned|covered|specified|available)\b)",
      R"(^\W*(i|we) (don't|do not|cannot|can't) (know|find|answer)\b)",
      R"(^\W*(there is )?no (relevant )?(information|answer|mention)\b)",
      R"(^\W*the (documentation|context|provided context) (does not|doesn't) (contain|mention|say|specify|include)\b)",
      R"(^\W*unanswerable\b)",
  };
}

RefusalPolicy::RefusalPolicy(RefusalPolicyOptions options) : options_(std::move(options)) {
  if (options_.refusal_patterns.empty()) {
    options_.refusal_patterns = RefusalPolicyOptions::default_patterns();
  }
  for (const auto &pattern : options_.refusal_patterns) {
    try {
      patterns_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error &e) {
      throw std::invalid_argument("Invalid refusal pattern '" + pattern + "': " + e.what());
    }
  }
}

RefusalReason RefusalPolicy::check_retrieval(const std::vector<RetrievedChunk> &retrieved,
                                             float threshold) const {
  if (retrieved.empty()) {
    return RefusalReason::NO_RELEVANT_CONTEXT;
  }
  float top_score = retrieved.front().score;
  for (const auto &chunk : retrieved) {
    top_score = std::max(top_score, chunk.score);
  }
  return top_score < threshold ? RefusalReason::NO_RELEVANT_CONTEXT : RefusalReason::NONE;
}

bool RefusalPolicy::matches_refusal_pattern(const std::string &text) const {
  for (const auto &pattern : patterns_) {
    if (std::regex_search(text, pattern)) {
      return true;
    }
  }
  return false;
}

RefusalReason RefusalPolicy::check_generation(const std::string &generated) const {
  const bool blank = std::all_of(generated.begin(), generated.end(),
                                 [](unsigned char c) { return std::isspace(c); });
  if (blank || matches_refusal_pattern(generated)) {
    return RefusalReason::MODEL_DETECTED_ABSENCE;
  }
  return RefusalReason::NONE;
}

}  // namespace docqa_core
