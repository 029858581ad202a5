#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "docqa_core/async/bounded_queue.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {
class EmbeddingGateway;
}

namespace docqa_core::async {

struct EmbeddingJob {
  size_t slot;
  Chunk* chunk;
};

struct RetryPolicy {
  int max_retries = 2;
  std::chrono::milliseconds backoff{200};
};

/**
 * @class Worker
 * @brief A single thread that embeds chunks pulled from the shared job queue.
 *
 * The embedding is written straight into the job's chunk and a failure message
 * into the job's slot of the shared error table. Every slot is owned by exactly
 * one job, so workers never touch the same element.
 */
class Worker {
 public:
  Worker(int worker_id,
         BoundedQueue<EmbeddingJob>& queue,
         EmbeddingGateway& gateway,
         RetryPolicy retry_policy,
         std::vector<std::optional<std::string>>& errors);

  /**
   * @brief Destructor. Ensures the worker thread is stopped and joined cleanly.
   */
  ~Worker();

  void start();

  // Finish the current job, then exit without draining the queue.
  void stop();

  void join();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();
  void process(const EmbeddingJob& job);

  int worker_id_;
  BoundedQueue<EmbeddingJob>& queue_;
  EmbeddingGateway& gateway_;
  RetryPolicy retry_policy_;
  std::vector<std::optional<std::string>>& errors_;
  std::atomic<bool> should_stop_{false};
  std::thread thread_;
};

}  // namespace docqa_core::async
