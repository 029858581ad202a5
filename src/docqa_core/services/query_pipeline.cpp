#include "docqa_core/services/query_pipeline.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

#include "docqa_core/llm/gateways.hpp"

namespace docqa_core {

namespace {

std::string trim(const std::string &text) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(text.begin(), text.end(), not_space);
  auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

}  // namespace

QueryPipeline::QueryPipeline(const IndexRegistry &registry,
                             EmbeddingGateway &embedder,
                             GenerationGateway &generator,
                             RefusalPolicy policy,
                             QueryOptions defaults)
    : registry_(registry),
      generator_(generator),
      retriever_(embedder),
      policy_(std::move(policy)),
      defaults_(defaults) {}

QueryResult QueryPipeline::refuse(QueryResult result, RefusalReason reason) const {
  result.refused = true;
  result.reason = reason;
  result.answer = policy_.refusal_message();
  result.sources.clear();
  std::cout << "QueryPipeline: REFUSED (" << to_string(reason) << ")";
  if (!result.error.empty()) {
    std::cout << ": " << result.error;
  }
  std::cout << std::endl;
  return result;
}

QueryResult QueryPipeline::query(const std::string &question, int k, float threshold) const {
  QueryOptions options = defaults_;
  options.top_k = k;
  options.similarity_threshold = threshold;
  return query(question, options);
}

QueryResult QueryPipeline::query(const std::string &question, const QueryOptions &options) const {
  if (trim(question).empty()) {
    throw std::invalid_argument("Question must not be empty");
  }
  if (options.top_k < 1) {
    throw std::invalid_argument("top_k must be at least 1");
  }
  if (options.context_budget_chars == 0) {
    throw std::invalid_argument("context_budget_chars must be positive");
  }

  QueryResult result;

  // 1. One snapshot for the whole query
  std::shared_ptr<const IndexSnapshot> snapshot = registry_.current();
  if (!snapshot->index || snapshot->index->empty()) {
    return refuse(std::move(result), RefusalReason::EMPTY_INDEX);
  }

  // 2. Retrieve
  try {
    result.retrieved = retriever_.retrieve(*snapshot->index, question, options.top_k);
  } catch (const RetrievalFailed &e) {
    result.error = e.what();
    return refuse(std::move(result), RefusalReason::RETRIEVAL_FAILED);
  }

  // 3. Similarity gate; generation is never called past a refusal here
  RefusalReason reason = policy_.check_retrieval(result.retrieved, options.similarity_threshold);
  if (reason != RefusalReason::NONE) {
    return refuse(std::move(result), reason);
  }

  // 4. Assemble the bounded context from the ranked prefix that clears the threshold
  std::vector<RetrievedChunk> relevant;
  for (const RetrievedChunk &retrieved : result.retrieved) {
    if (retrieved.score < options.similarity_threshold) {
      break;
    }
    relevant.push_back(retrieved);
  }
  AssembledContext context = assembler_.assemble(relevant, options.context_budget_chars);
  result.context = context.text;
  if (context.empty()) {
    return refuse(std::move(result), RefusalReason::NO_RELEVANT_CONTEXT);
  }

  // 5. Generate, once; a failure is not retried
  std::string generated;
  try {
    generated = generator_.generate(question, context.text);
  } catch (const GenerationUnavailable &e) {
    result.error = e.what();
    return refuse(std::move(result), RefusalReason::GENERATION_FAILED);
  }

  // 6. Model self-report gate
  reason = policy_.check_generation(generated);
  if (reason != RefusalReason::NONE) {
    return refuse(std::move(result), reason);
  }

  // 7. Answer and cite
  result.refused = false;
  result.reason = RefusalReason::NONE;
  result.answer = trim(generated);
  result.sources = citations_.resolve(context, result.retrieved, QueryOutcome::ANSWERED);
  std::cout << "QueryPipeline: ANSWERED from " << result.sources.size() << " source(s)"
            << std::endl;
  return result;
}

}  // namespace docqa_core
