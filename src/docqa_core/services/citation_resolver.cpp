#include "docqa_core/services/citation_resolver.hpp"

#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace docqa_core {

std::vector<std::string> CitationResolver::resolve(const AssembledContext &context,
                                                   const std::vector<RetrievedChunk> &retrieved,
                                                   QueryOutcome outcome) const {
  if (outcome == QueryOutcome::REFUSED) {
    return {};
  }

  std::unordered_map<std::string, const std::string *> source_by_id;
  for (const auto &item : retrieved) {
    source_by_id.emplace(item.chunk.id, &item.chunk.source_path);
  }

  std::vector<std::string> sources;
  std::unordered_set<std::string> seen;
  for (const auto &chunk_id : context.chunk_ids) {
    auto it = source_by_id.find(chunk_id);
    if (it == source_by_id.end()) {
      throw std::invalid_argument("Context references unknown chunk: " + chunk_id);
    }
    if (seen.insert(*it->second).second) {
      sources.push_back(*it->second);
    }
  }
  return sources;
}

}  // namespace docqa_core
