#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/index/index_builder.hpp"
#include "docqa_core/index/index_registry.hpp"
#include "docqa_core/index/index_store.hpp"

namespace docqa_core {

struct RebuildResult {
  bool success;
  std::string error_message;
  bool already_running;
  std::string generation;
  size_t document_count;
  size_t skipped_documents;
  size_t chunk_count;
  size_t dropped_chunks;

  // Constructor for success
  static RebuildResult success_response(const std::string &generation,
                                        size_t documents,
                                        size_t skipped,
                                        size_t chunks,
                                        size_t dropped) {
    return {true, "", false, generation, documents, skipped, chunks, dropped};
  }

  // Constructor for failure
  static RebuildResult failure_response(const std::string &error, bool already_running = false) {
    return {false, error, already_running, "", 0, 0, 0, 0};
  }
};

struct IndexServiceOptions {
  std::filesystem::path index_dir = "./data/processed";
  std::filesystem::path corpus_dir = "./data/raw";
  size_t generations_to_keep = 2;
  IndexBuilderOptions builder;
};

/**
 * @class IndexService
 * @brief Owns the offline side: ingest a corpus, build, persist, then swap.
 *
 * A rebuild only replaces the served index after the new generation is on disk
 * and CURRENT points at it; any failure before that leaves both the served and
 * the persisted index untouched. One rebuild runs at a time.
 */
class IndexService {
 public:
  IndexService(IndexRegistry &registry, EmbeddingGateway &embedder, IndexServiceOptions options);

  // Serves the generation CURRENT points at. Returns false when there is none
  // or it cannot be used.
  bool load_existing();

  RebuildResult rebuild(const std::filesystem::path &corpus_path);
  RebuildResult rebuild() {
    return rebuild(options_.corpus_dir);
  }

  // Manifest of the served index
  std::optional<IndexManifest> info() const;

  bool rebuild_in_progress() const;

 private:
  // Reads every .md file under the corpus in path order; unreadable files are skipped.
  std::vector<Document> ingest(const std::filesystem::path &corpus_path, size_t &skipped) const;

  IndexRegistry &registry_;
  IndexServiceOptions options_;
  MarkdownExtractor extractor_;
  IndexBuilder builder_;
  IndexStore store_;
  mutable std::mutex rebuild_mutex_;
};

}  // namespace docqa_core
