#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <unistd.h>

#include <cstdio>

#include "docqa_api/config.hpp"

namespace {

std::string write_temp_file(const std::string& contents) {
  char filename_template[] = "/tmp/docqa_config_test_XXXXXX.json";
  int fd = mkstemps(filename_template, 5); // 5 for ".json"
  if (fd == -1) {
    throw std::runtime_error("Failed to create temporary file");
  }
  FILE* file = fdopen(fd, "w");
  if (!file) {
    close(fd);
    throw std::runtime_error("Failed to open temporary file stream");
  }
  fwrite(contents.data(), 1, contents.size(), file);
  fclose(file);
  return std::string(filename_template);
}

void remove_file(const std::string& path) {
  std::remove(path.c_str());
}

} // namespace

TEST(ConfigTest, LoadsFromJsonWithDefaults) {
  nlohmann::json j = {
      {"api_base_url", "0.0.0.0:8080"},
      {"corpus_dir", "./docs"},
      {"embedding_model", "multilingual-e5-small"},
      {"num_workers", 4},
      {"similarity_threshold", 0.5}
  };

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "0.0.0.0:8080");
  EXPECT_EQ(cfg.corpus_dir, "./docs");
  EXPECT_EQ(cfg.embedding_model, "multilingual-e5-small");
  EXPECT_EQ(cfg.num_workers, 4);
  EXPECT_FLOAT_EQ(cfg.similarity_threshold, 0.5f);
  EXPECT_EQ(cfg.index_dir, "./data/processed");
}

TEST(ConfigTest, AppliesDefaultsWhenMissing) {
  nlohmann::json j = nlohmann::json::object();

  Config cfg = Config::from_json(j);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:3030");
  EXPECT_EQ(cfg.corpus_dir, "./data/raw");
  EXPECT_EQ(cfg.ollama_url, "http://localhost:11434");
  EXPECT_EQ(cfg.query_prefix, "query: ");
  EXPECT_EQ(cfg.passage_prefix, "passage: ");
  EXPECT_EQ(cfg.num_workers, 2);
  EXPECT_EQ(cfg.default_top_k, 3);
  EXPECT_FLOAT_EQ(cfg.similarity_threshold, 0.35f);
  EXPECT_EQ(cfg.context_budget_chars, 2000);
  EXPECT_EQ(cfg.refusal_patterns, docqa_core::RefusalPolicyOptions::default_patterns());
  EXPECT_EQ(cfg.refusal_message, "Not found in the documentation.");
  EXPECT_FALSE(cfg.build_on_startup);
  EXPECT_EQ(cfg.server_threads, 0);
}

TEST(ConfigTest, FromFileParsesAndValidates) {
  std::string contents = R"JSON({
    "api_base_url": "127.0.0.1:4000",
    "index_dir": "./index",
    "generation_model": "qwen2.5",
    "default_top_k": 5,
    "refusal_patterns": ["^no idea"]
  })JSON";

  std::string path = write_temp_file(contents);
  Config cfg;
  try {
    cfg = Config::from_file(path);
  } catch (...) {
    remove_file(path);
    throw;
  }
  remove_file(path);

  EXPECT_EQ(cfg.api_base_url, "127.0.0.1:4000");
  EXPECT_EQ(cfg.index_dir, "./index");
  EXPECT_EQ(cfg.generation_model, "qwen2.5");
  EXPECT_EQ(cfg.default_top_k, 5);
  EXPECT_EQ(cfg.refusal_patterns, std::vector<std::string>{"^no idea"});
}

TEST(ConfigTest, DerivedOptionsCarryValues) {
  nlohmann::json j = {
      {"index_dir", "/srv/index"},
      {"chunk_max_chars", 800},
      {"chunk_min_split_chars", 100},
      {"num_workers", 3},
      {"embedding_max_retries", 4},
      {"default_top_k", 6},
      {"context_budget_chars", 1200},
      {"refusal_message", "Unknown."}
  };

  Config cfg = Config::from_json(j);

  docqa_core::IndexServiceOptions index = cfg.index_options();
  EXPECT_EQ(index.index_dir, "/srv/index");
  EXPECT_EQ(index.builder.chunker.max_chars, 800u);
  EXPECT_EQ(index.builder.chunker.min_split_chars, 100u);
  EXPECT_EQ(index.builder.num_workers, 3u);
  EXPECT_EQ(index.builder.retry.max_retries, 4);
  EXPECT_EQ(index.builder.embedding_model, "nomic-embed-text");

  docqa_core::QueryOptions query = cfg.query_defaults();
  EXPECT_EQ(query.top_k, 6);
  EXPECT_EQ(query.context_budget_chars, 1200u);

  EXPECT_EQ(cfg.refusal_options().refusal_message, "Unknown.");
}

TEST(ConfigTest, InvalidPathThrows) {
  EXPECT_THROW({
    (void)Config::from_file("/nonexistent/path/config.json");
  }, std::runtime_error);
}

TEST(ConfigTest, MalformedJsonThrows) {
  std::string path = write_temp_file("{ \"api_base_url\": ");
  EXPECT_THROW({ (void)Config::from_file(path); }, std::runtime_error);
  remove_file(path);
}

TEST(ConfigTest, WrongValueTypeThrows) {
  nlohmann::json j = {{"default_top_k", "three"}};
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, EmptyRequiredFieldThrows) {
  nlohmann::json j = {{"api_base_url", ""}};
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);

  j = {{"embedding_model", ""}};
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);

  j = {{"refusal_message", ""}};
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}

TEST(ConfigTest, OutOfRangeValuesThrow) {
  for (const nlohmann::json& j : {
           nlohmann::json{{"num_workers", 0}},
           nlohmann::json{{"default_top_k", 0}},
           nlohmann::json{{"similarity_threshold", 1.5}},
           nlohmann::json{{"context_budget_chars", 0}},
           nlohmann::json{{"max_embedding_failure_ratio", -0.1}},
           nlohmann::json{{"chunk_max_chars", 100}, {"chunk_min_split_chars", 100}},
           nlohmann::json{{"embedding_max_retries", -1}},
       }) {
    EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error) << j.dump();
  }
}

TEST(ConfigTest, MalformedRefusalPatternThrows) {
  nlohmann::json j = {{"refusal_patterns", nlohmann::json::array({"(unclosed"})}};
  EXPECT_THROW({ (void)Config::from_json(j); }, std::runtime_error);
}
