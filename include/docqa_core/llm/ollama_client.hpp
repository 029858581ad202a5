#pragma once

#include <string>
#include <vector>

#include "docqa_core/llm/gateways.hpp"

namespace docqa_core {

struct OllamaSettings {
  std::string url = "http://localhost:11434";
  int timeout_seconds = 60;
};

// Points ollama-hpp at the server and applies the request timeouts.
// Returns false when the server does not answer.
bool configure_ollama(const OllamaSettings &settings);

/**
 * Embedding gateway backed by an Ollama embedding model.
 *
 * The role prefix is part of the contract of e5-style models; both the index
 * build and the query path go through embed() so the convention cannot drift.
 */
class OllamaEmbeddingGateway : public EmbeddingGateway {
 public:
  OllamaEmbeddingGateway(const std::string &embedding_model,
                         const std::string &query_prefix = "query: ",
                         const std::string &passage_prefix = "passage: ");

  // Disable copy constructor and assignment
  OllamaEmbeddingGateway(const OllamaEmbeddingGateway &) = delete;
  OllamaEmbeddingGateway &operator=(const OllamaEmbeddingGateway &) = delete;

  std::vector<float> embed(const std::string &text, EmbeddingRole role) override;

  std::string apply_prefix(const std::string &text, EmbeddingRole role) const;

 private:
  std::string embedding_model_;
  std::string query_prefix_;
  std::string passage_prefix_;
};

class OllamaGenerationGateway : public GenerationGateway {
 public:
  static constexpr const char *NOT_FOUND_REPLY = "Not found in the documentation.";

  OllamaGenerationGateway(const std::string &generation_model, int max_tokens = 150, int seed = 42);

  OllamaGenerationGateway(const OllamaGenerationGateway &) = delete;
  OllamaGenerationGateway &operator=(const OllamaGenerationGateway &) = delete;

  std::string generate(const std::string &question, const std::string &context) override;

  static std::string build_prompt(const std::string &question, const std::string &context);

 private:
  std::string generation_model_;
  int max_tokens_;
  int seed_;
};

}  // namespace docqa_core
