#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace docqa_core {

struct IndexedDocument {
  std::string source_path;
  std::string content_hash;
  int chunk_count = 0;
};

// Describes one persisted index generation.
struct IndexManifest {
  std::string generation;
  std::string embedding_model;
  int dimension = 0;
  size_t chunk_count = 0;
  std::string corpus_fingerprint;
  std::chrono::system_clock::time_point built_at;
  std::vector<IndexedDocument> documents;
};

}  // namespace docqa_core
