#pragma once

#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/services/index_service.hpp"
#include "docqa_core/services/refusal_policy.hpp"
#include "docqa_core/types/query.hpp"

class Config {
 public:
  std::string api_base_url;
  int server_threads;  // 0 = one per core
  std::string corpus_dir;
  std::string index_dir;

  // Model backends
  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;
  std::string query_prefix;
  std::string passage_prefix;
  int request_timeout_seconds;
  int generation_max_tokens;
  int generation_seed;

  // Index build
  int num_workers;
  int work_queue_capacity;
  int embedding_max_retries;
  double max_embedding_failure_ratio;
  int chunk_max_chars;
  int chunk_min_split_chars;
  int generations_to_keep;
  bool build_on_startup;

  // Query defaults and refusal policy
  int default_top_k;
  float similarity_threshold;
  int context_budget_chars;
  std::vector<std::string> refusal_patterns;
  std::string refusal_message;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    try {
      // Apply defaults when keys are missing
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
      config.server_threads = json_config.value("server_threads", 0);
      config.corpus_dir = json_config.value("corpus_dir", std::string("./data/raw"));
      config.index_dir = json_config.value("index_dir", std::string("./data/processed"));

      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("nomic-embed-text"));
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));
      config.query_prefix = json_config.value("query_prefix", std::string("query: "));
      config.passage_prefix = json_config.value("passage_prefix", std::string("passage: "));
      config.request_timeout_seconds = json_config.value("request_timeout_seconds", 60);
      config.generation_max_tokens = json_config.value("generation_max_tokens", 150);
      config.generation_seed = json_config.value("generation_seed", 42);

      config.num_workers = json_config.value("num_workers", 2);
      config.work_queue_capacity = json_config.value("work_queue_capacity", 64);
      config.embedding_max_retries = json_config.value("embedding_max_retries", 2);
      config.max_embedding_failure_ratio = json_config.value("max_embedding_failure_ratio", 0.1);
      config.chunk_max_chars = json_config.value("chunk_max_chars", 1500);
      config.chunk_min_split_chars = json_config.value("chunk_min_split_chars", 200);
      config.generations_to_keep = json_config.value("generations_to_keep", 2);
      config.build_on_startup = json_config.value("build_on_startup", false);

      config.default_top_k = json_config.value("default_top_k", 3);
      config.similarity_threshold = json_config.value("similarity_threshold", 0.35f);
      config.context_budget_chars = json_config.value("context_budget_chars", 2000);
      config.refusal_patterns = json_config.value(
          "refusal_patterns", docqa_core::RefusalPolicyOptions::default_patterns());
      config.refusal_message =
          json_config.value("refusal_message", std::string("Not found in the documentation."));
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
  }

  docqa_core::OllamaSettings ollama_settings() const {
    return {ollama_url, request_timeout_seconds};
  }

  docqa_core::QueryOptions query_defaults() const {
    docqa_core::QueryOptions options;
    options.top_k = default_top_k;
    options.similarity_threshold = similarity_threshold;
    options.context_budget_chars = static_cast<size_t>(context_budget_chars);
    return options;
  }

  docqa_core::RefusalPolicyOptions refusal_options() const {
    docqa_core::RefusalPolicyOptions options;
    options.similarity_threshold = similarity_threshold;
    options.refusal_patterns = refusal_patterns;
    options.refusal_message = refusal_message;
    return options;
  }

  docqa_core::IndexServiceOptions index_options() const {
    docqa_core::IndexServiceOptions options;
    options.index_dir = index_dir;
    options.corpus_dir = corpus_dir;
    options.generations_to_keep = static_cast<size_t>(generations_to_keep);
    options.builder.chunker.max_chars = static_cast<size_t>(chunk_max_chars);
    options.builder.chunker.min_split_chars = static_cast<size_t>(chunk_min_split_chars);
    options.builder.num_workers = static_cast<size_t>(num_workers);
    options.builder.queue_capacity = static_cast<size_t>(work_queue_capacity);
    options.builder.retry.max_retries = embedding_max_retries;
    options.builder.max_failure_ratio = max_embedding_failure_ratio;
    options.builder.embedding_model = embedding_model;
    return options;
  }

 private:
  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (server_threads < 0) {
      throw std::runtime_error("server_threads cannot be negative");
    }
    if (corpus_dir.empty()) {
      throw std::runtime_error("corpus_dir cannot be empty");
    }
    if (index_dir.empty()) {
      throw std::runtime_error("index_dir cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (generation_model.empty()) {
      throw std::runtime_error("generation_model cannot be empty");
    }
    if (request_timeout_seconds <= 0) {
      throw std::runtime_error("request_timeout_seconds must be greater than 0");
    }
    if (generation_max_tokens <= 0) {
      throw std::runtime_error("generation_max_tokens must be greater than 0");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (work_queue_capacity <= 0) {
      throw std::runtime_error("work_queue_capacity must be greater than 0");
    }
    if (embedding_max_retries < 0) {
      throw std::runtime_error("embedding_max_retries cannot be negative");
    }
    if (max_embedding_failure_ratio < 0.0 || max_embedding_failure_ratio > 1.0) {
      throw std::runtime_error("max_embedding_failure_ratio must be within [0, 1]");
    }
    if (chunk_max_chars <= 0) {
      throw std::runtime_error("chunk_max_chars must be greater than 0");
    }
    if (chunk_min_split_chars < 0 || chunk_min_split_chars >= chunk_max_chars) {
      throw std::runtime_error("chunk_min_split_chars must be within [0, chunk_max_chars)");
    }
    if (generations_to_keep <= 0) {
      throw std::runtime_error("generations_to_keep must be greater than 0");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
    if (similarity_threshold < -1.0f || similarity_threshold > 1.0f) {
      throw std::runtime_error("similarity_threshold must be within [-1, 1]");
    }
    if (context_budget_chars <= 0) {
      throw std::runtime_error("context_budget_chars must be greater than 0");
    }
    if (refusal_message.empty()) {
      throw std::runtime_error("refusal_message cannot be empty");
    }
    for (const auto& pattern : refusal_patterns) {
      try {
        std::regex compiled(pattern, std::regex::ECMAScript | std::regex::icase);
      } catch (const std::regex_error& e) {
        throw std::runtime_error("Invalid refusal pattern '" + pattern + "': " + e.what());
      }
    }
  }
};
