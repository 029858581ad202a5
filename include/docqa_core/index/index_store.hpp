#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/types/index_manifest.hpp"

namespace docqa_core {

class IndexStoreError : public std::exception {
 public:
  explicit IndexStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct StoredIndex {
  std::shared_ptr<const VectorIndex> index;
  IndexManifest manifest;
};

/**
 * @class IndexStore
 * @brief Durable storage for index generations.
 *
 * Layout under the root directory:
 *   generations/<id>/vectors.faiss   row-major vectors, row order = chunk order
 *   generations/<id>/metadata.db     sqlite sidecar: manifest, documents, chunks
 *   CURRENT                          id of the generation being served
 *
 * A generation is written under "<id>.partial" and renamed once both artifacts
 * are complete; CURRENT is replaced with a rename as well, so a reader that
 * follows CURRENT never sees a half-written generation. Files and their parent
 * directories are fsync'ed around each rename, so CURRENT never survives a
 * power loss pointing at data that did not.
 */
class IndexStore {
 public:
  static constexpr const char *VECTORS_FILE = "vectors.faiss";
  static constexpr const char *METADATA_FILE = "metadata.db";
  static constexpr const char *CURRENT_FILE = "CURRENT";

  explicit IndexStore(std::filesystem::path root, size_t generations_to_keep = 2);

  // Persists both artifacts as a new generation and returns its id. Does not
  // touch CURRENT; call publish() once the caller is ready to switch.
  std::string save(const VectorIndex &index, IndexManifest &manifest);

  // Atomically points CURRENT at a saved generation.
  void publish(const std::string &generation);

  std::optional<StoredIndex> load_current() const;
  StoredIndex load(const std::string &generation) const;

  std::optional<std::string> current_generation() const;
  std::vector<std::string> list_generations() const;

  // Removes stale generations, keeping the current one and the newest N.
  void prune();

  const std::filesystem::path &root() const {
    return root_;
  }

  // Flushes a file or directory entry to stable storage.
  static void sync_to_disk(const std::filesystem::path &path);

 private:
  std::filesystem::path root_;
  size_t generations_to_keep_;

  std::filesystem::path generations_dir() const {
    return root_ / "generations";
  }
  std::string next_generation_id() const;
  void write_vectors(const VectorIndex &index, const std::filesystem::path &path) const;
  void write_sidecar(const VectorIndex &index,
                     const IndexManifest &manifest,
                     const std::filesystem::path &path) const;
  std::unique_ptr<faiss::IndexFlatIP> read_vectors(const std::filesystem::path &path) const;
  IndexManifest read_sidecar(const std::filesystem::path &path, std::vector<Chunk> &chunks) const;

  static std::string time_point_to_string(const std::chrono::system_clock::time_point &tp);
  static std::chrono::system_clock::time_point string_to_time_point(const std::string &time_str);
};

}  // namespace docqa_core
