#include "docqa_core/index/index_builder.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

#include "docqa_core/async/worker_pool.hpp"
#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/llm/gateways.hpp"

namespace docqa_core {

IndexBuilder::IndexBuilder(EmbeddingGateway &gateway, IndexBuilderOptions options)
    : gateway_(gateway), options_(std::move(options)), chunker_(options_.chunker) {
  if (options_.max_failure_ratio < 0.0 || options_.max_failure_ratio > 1.0) {
    throw std::invalid_argument("max_failure_ratio must be within [0, 1]");
  }
}

BuildOutput IndexBuilder::build(std::vector<Document> documents) const {
  if (documents.empty()) {
    throw BuildFailed("No documents to index");
  }

  std::stable_sort(documents.begin(), documents.end(), [](const Document &a, const Document &b) {
    return a.source_path < b.source_path;
  });
  auto duplicate = std::adjacent_find(
      documents.begin(), documents.end(),
      [](const Document &a, const Document &b) { return a.source_path == b.source_path; });
  if (duplicate != documents.end()) {
    throw BuildFailed("Duplicate document source path: " + duplicate->source_path);
  }

  // 1. Chunk every document in order
  std::vector<Chunk> chunks;
  for (const Document &document : documents) {
    for (const Chunk &chunk : chunker_.chunk(document)) {
      chunks.push_back(chunk);
    }
  }
  std::cout << "IndexBuilder: " << documents.size() << " documents produced " << chunks.size()
            << " chunks" << std::endl;

  // 2. Embed in parallel; results land in chunk order
  async::WorkerPool pool(options_.num_workers, options_.queue_capacity, gateway_,
                         options_.retry);
  std::vector<std::optional<std::string>> errors = pool.embed_passages(chunks);

  // 3. Enforce a single dimension across the index
  size_t dimension = 0;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (errors[i]) {
      continue;
    }
    const size_t size = chunks[i].vector_embedding.size();
    if (size == 0) {
      errors[i] = "empty embedding";
    } else if (dimension == 0) {
      dimension = size;
    } else if (size != dimension) {
      std::cerr << "Warning: Skipping chunk " << chunks[i].id
                << " due to mismatched vector dimension. Expected " << dimension << ", got "
                << size << "." << std::endl;
      errors[i] = "dimension mismatch";
    }
  }

  // 4. Drop failed chunks unless too many failed
  const size_t total = chunks.size();
  const size_t failed =
      static_cast<size_t>(std::count_if(errors.begin(), errors.end(),
                                        [](const std::optional<std::string> &e) { return e.has_value(); }));
  const double ratio = total == 0 ? 0.0 : static_cast<double>(failed) / static_cast<double>(total);
  if (failed == total || ratio > options_.max_failure_ratio) {
    throw BuildFailed("Embedding failed for " + std::to_string(failed) + " of " +
                      std::to_string(total) + " chunks (limit " +
                      std::to_string(options_.max_failure_ratio) + ")");
  }

  std::vector<Chunk> kept;
  kept.reserve(total - failed);
  std::unordered_map<std::string, int> kept_per_document;
  for (size_t i = 0; i < total; ++i) {
    if (errors[i]) {
      std::cerr << "IndexBuilder: dropping chunk " << chunks[i].id << ": " << *errors[i]
                << std::endl;
      continue;
    }
    kept_per_document[chunks[i].source_path]++;
    kept.push_back(std::move(chunks[i]));
  }

  // 5. Manifest: per-document hashes plus a fingerprint of the whole corpus
  BuildOutput output;
  output.total_chunks = total;
  output.dropped_chunks = failed;
  output.manifest.embedding_model = options_.embedding_model;
  output.manifest.built_at = std::chrono::system_clock::now();
  std::string fingerprint_input;
  for (const Document &document : documents) {
    output.manifest.documents.push_back(
        {document.source_path, document.content_hash, kept_per_document[document.source_path]});
    fingerprint_input += document.source_path + '\0' + document.content_hash + '\n';
  }
  output.manifest.corpus_fingerprint =
      MarkdownExtractor().compute_hash_from_content(fingerprint_input);

  output.index = VectorIndex::from_chunks(std::move(kept), options_.embedding_model);
  output.manifest.dimension = output.index->dimension();
  output.manifest.chunk_count = output.index->size();

  std::cout << "IndexBuilder: indexed " << output.manifest.chunk_count << " chunks (" << failed
            << " dropped), dimension " << output.manifest.dimension << std::endl;
  return output;
}

}  // namespace docqa_core
