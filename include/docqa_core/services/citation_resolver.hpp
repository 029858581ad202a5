#pragma once

#include <string>
#include <vector>

#include "docqa_core/services/context_assembler.hpp"
#include "docqa_core/types/query.hpp"

namespace docqa_core {

class CitationResolver {
 public:
  // Distinct source paths of the chunks in the assembled context, in order of
  // first appearance. Empty for a refused query.
  std::vector<std::string> resolve(const AssembledContext &context,
                                   const std::vector<RetrievedChunk> &retrieved,
                                   QueryOutcome outcome) const;
};

}  // namespace docqa_core
