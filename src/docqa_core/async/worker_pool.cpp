#include "docqa_core/async/worker_pool.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace docqa_core::async {

WorkerPool::WorkerPool(size_t num_threads,
                       size_t queue_capacity,
                       EmbeddingGateway& gateway,
                       RetryPolicy retry_policy)
    : num_threads_(num_threads),
      queue_capacity_(queue_capacity),
      gateway_(gateway),
      retry_policy_(retry_policy) {
  if (num_threads_ == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }
  if (queue_capacity_ == 0) {
    throw std::invalid_argument("WorkerPool queue capacity must be greater than 0.");
  }
}

WorkerPool::~WorkerPool() = default;

std::vector<std::optional<std::string>> WorkerPool::embed_passages(std::vector<Chunk>& chunks) {
  std::vector<std::optional<std::string>> errors(chunks.size());
  if (chunks.empty()) {
    return errors;
  }

  BoundedQueue<EmbeddingJob> queue(queue_capacity_);
  std::vector<std::unique_ptr<Worker>> workers;
  const size_t worker_count = std::min(num_threads_, chunks.size());
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(
        std::make_unique<Worker>(static_cast<int>(i), queue, gateway_, retry_policy_, errors));
  }

  std::cout << "WorkerPool: embedding " << chunks.size() << " chunks on " << worker_count
            << " workers" << std::endl;
  for (const auto& worker : workers) {
    worker->start();
  }

  try {
    for (size_t slot = 0; slot < chunks.size(); ++slot) {
      if (!queue.push({slot, &chunks[slot]})) {
        break;
      }
    }
  } catch (...) {
    // Unblock the workers so their destructors can join
    queue.close();
    throw;
  }
  // Workers drain the remaining jobs, then exit
  queue.close();
  for (const auto& worker : workers) {
    worker->join();
  }
  return errors;
}

}  // namespace docqa_core::async
