#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "docqa_core/async/worker_pool.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docqa_tests {

using namespace docqa_core;
using namespace docqa_core::async;
using ::testing::_;
using ::testing::NiceMock;

class WorkerPoolTest : public ::testing::Test {
 protected:
  static std::vector<Chunk> make_chunks(int count) {
    std::vector<Chunk> chunks;
    for (int i = 0; i < count; ++i) {
      chunks.push_back(
          TestUtilities::create_test_chunk("doc.md", i, "chunk number " + std::to_string(i)));
    }
    return chunks;
  }

  static RetryPolicy fast_retries(int max_retries) {
    return {max_retries, std::chrono::milliseconds(1)};
  }

  NiceMock<MockEmbeddingGateway> gateway_;
};

TEST_F(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW(WorkerPool(0, 4, gateway_), std::invalid_argument);
}

TEST_F(WorkerPoolTest, ConstructorThrowsOnZeroCapacity) {
  EXPECT_THROW(WorkerPool(2, 0, gateway_), std::invalid_argument);
}

TEST_F(WorkerPoolTest, EmptyInput_NoCalls) {
  EXPECT_CALL(gateway_, embed(_, _)).Times(0);
  WorkerPool pool(2, 4, gateway_);
  std::vector<Chunk> chunks;
  EXPECT_TRUE(pool.embed_passages(chunks).empty());
}

TEST_F(WorkerPoolTest, EmbedsEveryChunkWithPassageRole) {
  EXPECT_CALL(gateway_, embed(_, EmbeddingRole::PASSAGE)).Times(40);
  EXPECT_CALL(gateway_, embed(_, EmbeddingRole::QUERY)).Times(0);

  WorkerPool pool(4, 3, gateway_);
  std::vector<Chunk> chunks = make_chunks(40);
  auto errors = pool.embed_passages(chunks);

  ASSERT_EQ(errors.size(), 40u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_FALSE(errors[i].has_value());
    // Results land on their own chunk whatever order workers finish in
    EXPECT_EQ(chunks[i].vector_embedding, hash_embedding(chunks[i].text));
  }
}

TEST_F(WorkerPoolTest, ConcurrencyNeverExceedsThreadCount) {
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};
  ON_CALL(gateway_, embed(_, _)).WillByDefault([&](const std::string& text, EmbeddingRole) {
    int now = ++in_flight;
    int previous = peak.load();
    while (now > previous && !peak.compare_exchange_weak(previous, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    --in_flight;
    return hash_embedding(text);
  });

  WorkerPool pool(2, 2, gateway_);
  std::vector<Chunk> chunks = make_chunks(20);
  auto errors = pool.embed_passages(chunks);

  EXPECT_LE(peak.load(), 2);
  for (const auto& error : errors) {
    EXPECT_FALSE(error.has_value());
  }
}

TEST_F(WorkerPoolTest, RetriesTransientFailures) {
  std::atomic<int> calls{0};
  ON_CALL(gateway_, embed(_, _)).WillByDefault([&](const std::string& text, EmbeddingRole) {
    if (calls++ == 0) {
      throw EmbeddingUnavailable("timeout");
    }
    return hash_embedding(text);
  });

  WorkerPool pool(1, 4, gateway_, fast_retries(2));
  std::vector<Chunk> chunks = make_chunks(1);
  auto errors = pool.embed_passages(chunks);

  EXPECT_FALSE(errors[0].has_value());
  EXPECT_EQ(calls.load(), 2);
  EXPECT_FALSE(chunks[0].vector_embedding.empty());
}

TEST_F(WorkerPoolTest, RecordsFailureAfterRetriesExhausted) {
  ON_CALL(gateway_, embed(testing::HasSubstr("number 3"), _))
      .WillByDefault(testing::Throw(EmbeddingUnavailable("model down")));
  EXPECT_CALL(gateway_, embed(testing::HasSubstr("number 3"), _)).Times(3);
  EXPECT_CALL(gateway_, embed(testing::Not(testing::HasSubstr("number 3")), _)).Times(5);

  WorkerPool pool(2, 4, gateway_, fast_retries(2));
  std::vector<Chunk> chunks = make_chunks(6);
  auto errors = pool.embed_passages(chunks);

  for (size_t i = 0; i < errors.size(); ++i) {
    if (i == 3) {
      ASSERT_TRUE(errors[i].has_value());
      EXPECT_EQ(*errors[i], "model down");
      EXPECT_TRUE(chunks[i].vector_embedding.empty());
    } else {
      EXPECT_FALSE(errors[i].has_value());
    }
  }
}

}  // namespace docqa_tests
