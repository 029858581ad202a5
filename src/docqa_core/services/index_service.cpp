#include "docqa_core/services/index_service.hpp"

#include <algorithm>
#include <iostream>

namespace docqa_core {

namespace fs = std::filesystem;

IndexService::IndexService(IndexRegistry &registry,
                           EmbeddingGateway &embedder,
                           IndexServiceOptions options)
    : registry_(registry),
      options_(std::move(options)),
      builder_(embedder, options_.builder),
      store_(options_.index_dir, options_.generations_to_keep) {}

bool IndexService::load_existing() {
  std::optional<StoredIndex> stored;
  try {
    stored = store_.load_current();
  } catch (const IndexStoreError &e) {
    std::cerr << "Error: Failed to load the persisted index: " << e.what() << std::endl;
    return false;
  } catch (const VectorIndexError &e) {
    std::cerr << "Error: Failed to load the persisted index: " << e.what() << std::endl;
    return false;
  }
  if (!stored) {
    std::cout << "IndexService: no persisted index under " << options_.index_dir << std::endl;
    return false;
  }

  const std::string &configured = options_.builder.embedding_model;
  if (!configured.empty() && !stored->manifest.embedding_model.empty() &&
      configured != stored->manifest.embedding_model) {
    std::cerr << "Warning: Persisted index was built with '" << stored->manifest.embedding_model
              << "' but '" << configured << "' is configured. Rebuild the index." << std::endl;
    return false;
  }

  registry_.swap(std::make_shared<const IndexSnapshot>(
      IndexSnapshot{stored->index, std::move(stored->manifest)}));
  std::cout << "IndexService: serving generation " << registry_.current()->manifest.generation
            << " (" << registry_.current()->index->size() << " chunks)" << std::endl;
  return true;
}

std::vector<Document> IndexService::ingest(const fs::path &corpus_path, size_t &skipped) const {
  std::vector<fs::path> files;
  for (const auto &entry : fs::recursive_directory_iterator(corpus_path)) {
    if (entry.is_regular_file() && extractor_.can_handle(entry.path())) {
      files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());

  std::vector<Document> documents;
  documents.reserve(files.size());
  skipped = 0;
  for (const auto &file : files) {
    try {
      documents.push_back(extractor_.extract(file, corpus_path));
    } catch (const IngestionError &e) {
      std::cerr << "Warning: Skipping " << file << ": " << e.what() << std::endl;
      ++skipped;
    }
  }
  return documents;
}

RebuildResult IndexService::rebuild(const fs::path &corpus_path) {
  std::unique_lock<std::mutex> lock(rebuild_mutex_, std::try_to_lock);
  if (!lock.owns_lock()) {
    return RebuildResult::failure_response("A rebuild is already in progress", true);
  }

  std::error_code ec;
  if (!fs::is_directory(corpus_path, ec)) {
    return RebuildResult::failure_response("Corpus directory not found: " +
                                           corpus_path.string());
  }

  std::cout << "IndexService: rebuilding from " << corpus_path << std::endl;

  // 1. Ingest
  size_t skipped = 0;
  std::vector<Document> documents;
  try {
    documents = ingest(corpus_path, skipped);
  } catch (const fs::filesystem_error &e) {
    return RebuildResult::failure_response("Failed to scan corpus: " + std::string(e.what()));
  }
  if (documents.empty()) {
    return RebuildResult::failure_response("No readable Markdown documents in " +
                                           corpus_path.string());
  }
  const size_t document_count = documents.size();

  // 2. Build
  BuildOutput output;
  try {
    output = builder_.build(std::move(documents));
  } catch (const BuildFailed &e) {
    std::cerr << "Error: Build failed: " << e.what() << std::endl;
    return RebuildResult::failure_response(e.what());
  } catch (const VectorIndexError &e) {
    std::cerr << "Error: Build failed: " << e.what() << std::endl;
    return RebuildResult::failure_response(e.what());
  }

  // 3. Persist and point CURRENT at it
  std::string generation;
  try {
    generation = store_.save(*output.index, output.manifest);
    store_.publish(generation);
  } catch (const IndexStoreError &e) {
    std::cerr << "Error: Failed to persist index: " << e.what() << std::endl;
    return RebuildResult::failure_response(e.what());
  }

  // 4. Swap; queries already running keep the snapshot they took
  registry_.swap(std::make_shared<const IndexSnapshot>(
      IndexSnapshot{output.index, output.manifest}));
  std::cout << "IndexService: now serving generation " << generation << std::endl;

  try {
    store_.prune();
  } catch (const IndexStoreError &e) {
    std::cerr << "Warning: Failed to prune old generations: " << e.what() << std::endl;
  } catch (const fs::filesystem_error &e) {
    std::cerr << "Warning: Failed to prune old generations: " << e.what() << std::endl;
  }

  return RebuildResult::success_response(generation, document_count, skipped,
                                         output.manifest.chunk_count, output.dropped_chunks);
}

std::optional<IndexManifest> IndexService::info() const {
  auto snapshot = registry_.current();
  if (!snapshot->index || snapshot->index->empty()) {
    return std::nullopt;
  }
  return snapshot->manifest;
}

bool IndexService::rebuild_in_progress() const {
  std::unique_lock<std::mutex> lock(rebuild_mutex_, std::try_to_lock);
  return !lock.owns_lock();
}

}  // namespace docqa_core
