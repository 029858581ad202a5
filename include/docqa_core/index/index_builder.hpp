#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/async/worker.hpp"
#include "docqa_core/chunking/chunker.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/types/document.hpp"
#include "docqa_core/types/index_manifest.hpp"

namespace docqa_core {

class EmbeddingGateway;

class BuildFailed : public std::exception {
 public:
  explicit BuildFailed(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct IndexBuilderOptions {
  ChunkerOptions chunker;
  size_t num_workers = 2;
  size_t queue_capacity = 64;
  async::RetryPolicy retry;
  // Fraction of chunks allowed to fail embedding before the whole build fails
  double max_failure_ratio = 0.1;
  std::string embedding_model;
};

struct BuildOutput {
  std::shared_ptr<const VectorIndex> index;
  IndexManifest manifest;
  size_t total_chunks = 0;
  size_t dropped_chunks = 0;
};

/**
 * @class IndexBuilder
 * @brief Chunks and embeds a document set into a fresh, unpublished index.
 *
 * Output structure is deterministic: documents are ordered by source path and
 * chunks by their position in the document, whatever order the workers finish
 * in. Chunks whose embedding fails are dropped; the build only fails when the
 * dropped share exceeds max_failure_ratio.
 */
class IndexBuilder {
 public:
  IndexBuilder(EmbeddingGateway &gateway, IndexBuilderOptions options);

  BuildOutput build(std::vector<Document> documents) const;

  const IndexBuilderOptions &options() const {
    return options_;
  }

 private:
  EmbeddingGateway &gateway_;
  IndexBuilderOptions options_;
  Chunker chunker_;
};

}  // namespace docqa_core
