#pragma once

#include <string>

#include "docqa_core/index/index_registry.hpp"
#include "docqa_core/services/citation_resolver.hpp"
#include "docqa_core/services/context_assembler.hpp"
#include "docqa_core/services/refusal_policy.hpp"
#include "docqa_core/services/retriever.hpp"
#include "docqa_core/types/query.hpp"

namespace docqa_core {

class EmbeddingGateway;
class GenerationGateway;

/**
 * @class QueryPipeline
 * @brief Retrieve, assemble, gate, generate, gate, cite: one question in, one QueryResult out.
 *
 * Each query takes one snapshot of the served index and uses it to the end, so
 * a concurrent rebuild never changes the index under a running query. The
 * pipeline keeps no state between queries and is safe to call from many
 * threads as long as the gateways are.
 *
 * Failures are folded into the result: an empty index, a failed query
 * embedding or a failed generation all come back REFUSED with a reason, never
 * as an exception and never with generated text.
 */
class QueryPipeline {
 public:
  QueryPipeline(const IndexRegistry &registry,
                EmbeddingGateway &embedder,
                GenerationGateway &generator,
                RefusalPolicy policy,
                QueryOptions defaults = {});

  /**
   * @throw std::invalid_argument for an empty question, top_k < 1 or a zero budget.
   */
  QueryResult query(const std::string &question, const QueryOptions &options) const;

  QueryResult query(const std::string &question, int k, float threshold) const;

  QueryResult query(const std::string &question) const {
    return query(question, defaults_);
  }

  const QueryOptions &defaults() const {
    return defaults_;
  }

 private:
  QueryResult refuse(QueryResult result, RefusalReason reason) const;

  const IndexRegistry &registry_;
  GenerationGateway &generator_;
  Retriever retriever_;
  ContextAssembler assembler_;
  RefusalPolicy policy_;
  CitationResolver citations_;
  QueryOptions defaults_;
};

}  // namespace docqa_core
