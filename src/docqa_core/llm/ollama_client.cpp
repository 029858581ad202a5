#include "docqa_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"

namespace docqa_core {

bool configure_ollama(const OllamaSettings &settings) {
  ollama::setServerURL(settings.url);
  ollama::setReadTimeout(settings.timeout_seconds);
  ollama::setWriteTimeout(settings.timeout_seconds);
  if (!ollama::is_running()) {
    std::cerr << "Warning: Ollama server is not running at " << settings.url << std::endl;
    return false;
  }
  return true;
}

OllamaEmbeddingGateway::OllamaEmbeddingGateway(const std::string &embedding_model,
                                               const std::string &query_prefix,
                                               const std::string &passage_prefix)
    : embedding_model_(embedding_model),
      query_prefix_(query_prefix),
      passage_prefix_(passage_prefix) {}

std::string OllamaEmbeddingGateway::apply_prefix(const std::string &text,
                                                 EmbeddingRole role) const {
  return (role == EmbeddingRole::QUERY ? query_prefix_ : passage_prefix_) + text;
}

std::vector<float> OllamaEmbeddingGateway::embed(const std::string &text, EmbeddingRole role) {
  try {
    ollama::response response =
        ollama::generate_embeddings(embedding_model_, apply_prefix(text, role));

    auto json_response = response.as_json();
    if (!json_response.contains("embeddings")) {
      throw EmbeddingUnavailable("Response does not contain embedding field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw EmbeddingUnavailable("Embeddings field is not a non-empty array");
    }
    std::vector<float> vector = embeddings[0].is_array()
                                    ? embeddings[0].get<std::vector<float>>()
                                    : embeddings.get<std::vector<float>>();
    if (vector.empty()) {
      throw EmbeddingUnavailable("Received empty embedding");
    }
    return vector;
  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailable("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailable("Malformed embedding response: " + std::string(e.what()));
  }
}

OllamaGenerationGateway::OllamaGenerationGateway(const std::string &generation_model,
                                                 int max_tokens,
                                                 int seed)
    : generation_model_(generation_model), max_tokens_(max_tokens), seed_(seed) {}

std::string OllamaGenerationGateway::build_prompt(const std::string &question,
                                                  const std::string &context) {
  std::string prompt =
      "You are an internal documentation assistant for a software engineering team.\n\n"
      "Your task is to answer the user's question using ONLY the documentation context.\n\n"
      "Guidelines:\n"
      "- Use only the information present in the documentation context.\n"
      "- If the documentation contains relevant information, summarize it clearly.\n"
      "- If the documentation does not contain the answer, reply exactly: ";
  prompt += NOT_FOUND_REPLY;
  prompt += "\n\nDocumentation Context:\n";
  prompt += context;
  prompt += "\n\nQuestion:\n";
  prompt += question;
  prompt += "\n\nAnswer:";
  return prompt;
}

std::string OllamaGenerationGateway::generate(const std::string &question,
                                              const std::string &context) {
  // Greedy decoding with a pinned seed keeps answers reproducible
  ollama::options options;
  options["temperature"] = 0;
  options["top_k"] = 1;
  options["seed"] = seed_;
  options["num_predict"] = max_tokens_;

  try {
    ollama::response response =
        ollama::generate(generation_model_, build_prompt(question, context), options);
    return response.as_simple_string();
  } catch (const ollama::exception &e) {
    throw GenerationUnavailable("Answer generation failed: " + std::string(e.what()));
  }
}

}  // namespace docqa_core
