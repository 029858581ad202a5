#include "docqa_core/index/index_registry.hpp"

#include <stdexcept>

namespace docqa_core {

namespace {

std::shared_ptr<const IndexSnapshot> empty_snapshot() {
  static const auto empty = std::make_shared<const IndexSnapshot>(
      IndexSnapshot{std::make_shared<const VectorIndex>(), IndexManifest{}});
  return empty;
}

}  // namespace

std::shared_ptr<const IndexSnapshot> IndexRegistry::current() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return current_ ? current_ : empty_snapshot();
}

std::shared_ptr<const IndexSnapshot> IndexRegistry::swap(std::shared_ptr<const IndexSnapshot> next) {
  if (!next || !next->index) {
    throw std::invalid_argument("IndexRegistry cannot serve a null index");
  }
  std::lock_guard<std::mutex> lock(mtx_);
  std::shared_ptr<const IndexSnapshot> previous = std::move(current_);
  current_ = std::move(next);
  return previous;
}

bool IndexRegistry::has_index() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return current_ && current_->index && !current_->index->empty();
}

}  // namespace docqa_core
