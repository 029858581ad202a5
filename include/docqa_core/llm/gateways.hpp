#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace docqa_core {

class EmbeddingUnavailable : public std::exception {
 public:
  explicit EmbeddingUnavailable(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class GenerationUnavailable : public std::exception {
 public:
  explicit GenerationUnavailable(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Asymmetric embedding models encode questions and passages differently
enum class EmbeddingRole { QUERY, PASSAGE };

inline std::string to_string(EmbeddingRole role) {
  return role == EmbeddingRole::QUERY ? "query" : "passage";
}

class EmbeddingGateway {
 public:
  virtual ~EmbeddingGateway() = default;

  // Returns a fixed-length vector; throws EmbeddingUnavailable on transport/model failure.
  virtual std::vector<float> embed(const std::string &text, EmbeddingRole role) = 0;
};

class GenerationGateway {
 public:
  virtual ~GenerationGateway() = default;

  // Deterministic: identical (question, context) pairs yield identical text.
  // Throws GenerationUnavailable on failure.
  virtual std::string generate(const std::string &question, const std::string &context) = 0;
};

}  // namespace docqa_core
