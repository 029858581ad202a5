#pragma once

#include <memory>
#include <mutex>

#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/types/index_manifest.hpp"

namespace docqa_core {

// One served index together with the manifest it was persisted under.
struct IndexSnapshot {
  std::shared_ptr<const VectorIndex> index;
  IndexManifest manifest;
};

/**
 * @class IndexRegistry
 * @brief Single-writer / multi-reader handoff for the served index.
 *
 * Readers take a snapshot once per query and keep using it even if a rebuild
 * swaps in a new index meanwhile; the old snapshot is released when the last
 * reader drops it. Swapping replaces the reference only, never the index.
 */
class IndexRegistry {
 public:
  IndexRegistry() = default;

  IndexRegistry(const IndexRegistry&) = delete;
  IndexRegistry& operator=(const IndexRegistry&) = delete;

  // Never null; an empty snapshot is returned before the first swap.
  std::shared_ptr<const IndexSnapshot> current() const;

  // Returns the snapshot that was replaced.
  std::shared_ptr<const IndexSnapshot> swap(std::shared_ptr<const IndexSnapshot> next);

  bool has_index() const;

 private:
  mutable std::mutex mtx_;
  std::shared_ptr<const IndexSnapshot> current_;
};

}  // namespace docqa_core
