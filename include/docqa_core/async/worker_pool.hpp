#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/async/worker.hpp"

namespace docqa_core {
class EmbeddingGateway;
}

namespace docqa_core::async {

/**
 * @class WorkerPool
 * @brief Embeds a batch of chunks on a fixed number of threads.
 *
 * Jobs flow through a bounded queue, so the producer blocks instead of
 * buffering the whole corpus when the model is slower than chunking.
 * The pool is RAII: destroying it stops and joins every worker.
 */
class WorkerPool {
 public:
  /**
   * @param num_threads The number of worker threads to create in the pool.
   * @param queue_capacity Maximum number of pending jobs.
   * @param gateway Shared embedding gateway; must be safe to call concurrently.
   * @param retry_policy Retries for transient EmbeddingUnavailable failures.
   */
  WorkerPool(size_t num_threads,
             size_t queue_capacity,
             EmbeddingGateway& gateway,
             RetryPolicy retry_policy = {});

  ~WorkerPool();

  /**
   * @brief Embeds every chunk in place with role=passage and blocks until done.
   * @return One entry per chunk: nullopt on success, the error message otherwise.
   */
  std::vector<std::optional<std::string>> embed_passages(std::vector<Chunk>& chunks);

  size_t size() const {
    return num_threads_;
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  size_t num_threads_;
  size_t queue_capacity_;
  EmbeddingGateway& gateway_;
  RetryPolicy retry_policy_;
};

}  // namespace docqa_core::async
