#include "docqa_core/async/worker.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "docqa_core/llm/gateways.hpp"

namespace docqa_core::async {

Worker::Worker(int worker_id,
               BoundedQueue<EmbeddingJob>& queue,
               EmbeddingGateway& gateway,
               RetryPolicy retry_policy,
               std::vector<std::optional<std::string>>& errors)
    : worker_id_(worker_id),
      queue_(queue),
      gateway_(gateway),
      retry_policy_(retry_policy),
      errors_(errors) {}

Worker::~Worker() {
  stop();
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop_.store(false);
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop_.store(true);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  while (!should_stop_.load()) {
    std::optional<EmbeddingJob> job = queue_.pop();
    if (!job) {
      break;  // queue closed and drained
    }
    process(*job);
  }
}

void Worker::process(const EmbeddingJob& job) {
  const int attempts = 1 + std::max(0, retry_policy_.max_retries);
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      job.chunk->vector_embedding = gateway_.embed(job.chunk->text, EmbeddingRole::PASSAGE);
      return;
    } catch (const EmbeddingUnavailable& e) {
      if (attempt == attempts) {
        std::cerr << "Worker [" << worker_id_ << "] ERROR embedding chunk " << job.chunk->id
                  << " after " << attempts << " attempt(s): " << e.what() << std::endl;
        errors_[job.slot] = e.what();
        return;
      }
      std::cerr << "Worker [" << worker_id_ << "] retrying chunk " << job.chunk->id << " ("
                << attempt << "/" << attempts << "): " << e.what() << std::endl;
      std::this_thread::sleep_for(retry_policy_.backoff * attempt);
    } catch (const std::exception& e) {
      // Not transient: fail the chunk without retrying
      std::cerr << "Worker [" << worker_id_ << "] ERROR embedding chunk " << job.chunk->id
                << ": " << e.what() << std::endl;
      errors_[job.slot] = e.what();
      return;
    }
  }
}

}  // namespace docqa_core::async
