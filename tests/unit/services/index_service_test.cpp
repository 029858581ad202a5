#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>

#include "docqa_core/services/index_service.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docqa_tests {

using namespace docqa_core;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

class IndexServiceTest : public TempDirTestBase {
 protected:
  void SetUp() override {
    TempDirTestBase::SetUp();
    corpus_dir_ = temp_dir_ / "raw";
    for (const auto &[path, markdown] : TestUtilities::sample_corpus()) {
      TestUtilities::write_file(corpus_dir_, path, markdown);
    }
  }

  IndexServiceOptions options(const std::string &model = "hash-embedding") const {
    IndexServiceOptions options;
    options.index_dir = temp_dir_ / "index";
    options.corpus_dir = corpus_dir_;
    options.generations_to_keep = 2;
    options.builder.num_workers = 2;
    options.builder.queue_capacity = 4;
    options.builder.retry = {0, std::chrono::milliseconds(1)};
    options.builder.embedding_model = model;
    return options;
  }

  std::filesystem::path corpus_dir_;
  IndexRegistry registry_;
  NiceMock<MockEmbeddingGateway> embedder_;
};

TEST_F(IndexServiceTest, Rebuild_PersistsAndSwaps) {
  IndexService service(registry_, embedder_, options());
  EXPECT_FALSE(service.info().has_value());

  RebuildResult result = service.rebuild();

  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.document_count, 3u);
  EXPECT_EQ(result.chunk_count, 3u);
  EXPECT_EQ(result.skipped_documents, 0u);
  EXPECT_FALSE(result.generation.empty());

  ASSERT_TRUE(registry_.has_index());
  EXPECT_EQ(registry_.current()->index->size(), 3u);
  EXPECT_EQ(registry_.current()->manifest.generation, result.generation);

  IndexStore store(temp_dir_ / "index");
  EXPECT_EQ(store.current_generation().value_or(""), result.generation);

  auto manifest = service.info();
  ASSERT_TRUE(manifest.has_value());
  EXPECT_EQ(manifest->documents.size(), 3u);
  EXPECT_EQ(manifest->documents[2].source_path, "guides/database.md");
}

TEST_F(IndexServiceTest, LoadExisting_ServesPersistedGeneration) {
  std::string generation;
  {
    IndexRegistry build_registry;
    IndexService builder(build_registry, embedder_, options());
    generation = builder.rebuild().generation;
  }

  IndexService service(registry_, embedder_, options());
  ASSERT_TRUE(service.load_existing());

  EXPECT_EQ(registry_.current()->manifest.generation, generation);
  EXPECT_EQ(registry_.current()->index->size(), 3u);
  EXPECT_EQ(registry_.current()->index->chunk_at(0).id, "authentication.md#00000");
}

TEST_F(IndexServiceTest, Rebuild_EmptyAndBlankDocumentsPersistAndReload) {
  TestUtilities::write_file(corpus_dir_, "empty.md", "");
  TestUtilities::write_file(corpus_dir_, "blank.md", "  \n\n\t\n");

  std::string generation;
  {
    IndexRegistry build_registry;
    IndexService builder(build_registry, embedder_, options());
    RebuildResult result = builder.rebuild();
    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.document_count, 5u);
    EXPECT_EQ(result.chunk_count, 5u);
    generation = result.generation;
  }

  IndexService service(registry_, embedder_, options());
  ASSERT_TRUE(service.load_existing());
  ASSERT_EQ(registry_.current()->manifest.generation, generation);

  const auto &index = *registry_.current()->index;
  ASSERT_EQ(index.size(), 5u);
  size_t empty_chunks = 0;
  for (size_t row = 0; row < index.size(); ++row) {
    const Chunk &chunk = index.chunk_at(row);
    if (chunk.id == "empty.md#00000" || chunk.id == "blank.md#00000") {
      EXPECT_EQ(chunk.text, "");
      ++empty_chunks;
    } else {
      EXPECT_FALSE(chunk.text.empty());
    }
  }
  EXPECT_EQ(empty_chunks, 2u);
}

TEST_F(IndexServiceTest, LoadExisting_NothingPersisted) {
  IndexService service(registry_, embedder_, options());
  EXPECT_FALSE(service.load_existing());
  EXPECT_FALSE(registry_.has_index());
}

TEST_F(IndexServiceTest, LoadExisting_RejectsIndexFromAnotherModel) {
  {
    IndexRegistry build_registry;
    IndexService builder(build_registry, embedder_, options("model-a"));
    ASSERT_TRUE(builder.rebuild().success);
  }

  IndexService service(registry_, embedder_, options("model-b"));
  EXPECT_FALSE(service.load_existing());
  EXPECT_FALSE(registry_.has_index());
}

TEST_F(IndexServiceTest, FailedRebuild_KeepsServedIndex) {
  IndexService service(registry_, embedder_, options());
  RebuildResult first = service.rebuild();
  ASSERT_TRUE(first.success);

  ON_CALL(embedder_, embed(_, _)).WillByDefault(Throw(EmbeddingUnavailable("model down")));
  TestUtilities::write_file(corpus_dir_, "new.md", "# New\n\nFresh content.");
  RebuildResult second = service.rebuild();

  EXPECT_FALSE(second.success);
  EXPECT_FALSE(second.already_running);
  EXPECT_EQ(registry_.current()->manifest.generation, first.generation);
  EXPECT_EQ(registry_.current()->index->size(), 3u);
  EXPECT_EQ(IndexStore(temp_dir_ / "index").current_generation().value_or(""), first.generation);
}

TEST_F(IndexServiceTest, Rebuild_EmptyCorpusFails) {
  std::filesystem::path empty = temp_dir_ / "empty";
  std::filesystem::create_directories(empty);
  TestUtilities::write_file(empty, "notes.txt", "not markdown");

  IndexService service(registry_, embedder_, options());
  RebuildResult result = service.rebuild(empty);

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(registry_.has_index());
}

TEST_F(IndexServiceTest, Rebuild_MissingCorpusFails) {
  IndexService service(registry_, embedder_, options());
  RebuildResult result = service.rebuild(temp_dir_ / "does-not-exist");

  EXPECT_FALSE(result.success);
  EXPECT_THAT(result.error_message, testing::HasSubstr("not found"));
}

TEST_F(IndexServiceTest, Rebuild_SkipsInvalidDocuments) {
  TestUtilities::write_file(corpus_dir_, "broken.md", std::string("# Broken\n\n\xFF\xFE bytes"));

  IndexService service(registry_, embedder_, options());
  RebuildResult result = service.rebuild();

  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.document_count, 3u);
  EXPECT_EQ(result.skipped_documents, 1u);
}

TEST_F(IndexServiceTest, Rebuild_PrunesOldGenerations) {
  IndexService service(registry_, embedder_, options());
  for (int i = 0; i < 4; ++i) {
    ASSERT_TRUE(service.rebuild().success);
  }

  IndexStore store(temp_dir_ / "index");
  EXPECT_LE(store.list_generations().size(), 2u);
  EXPECT_EQ(store.current_generation().value_or(""), registry_.current()->manifest.generation);
}

TEST_F(IndexServiceTest, Rebuild_RejectsConcurrentRebuild) {
  std::promise<void> entered;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();
  std::atomic<bool> first_call{true};
  ON_CALL(embedder_, embed(_, _)).WillByDefault([&](const std::string &text, EmbeddingRole) {
    if (first_call.exchange(false)) {
      entered.set_value();
      released.wait();
    }
    return hash_embedding(text);
  });

  IndexService service(registry_, embedder_, options());
  std::future<RebuildResult> running =
      std::async(std::launch::async, [&service]() { return service.rebuild(); });
  entered.get_future().wait();

  EXPECT_TRUE(service.rebuild_in_progress());
  RebuildResult rejected = service.rebuild();
  EXPECT_FALSE(rejected.success);
  EXPECT_TRUE(rejected.already_running);

  release.set_value();
  EXPECT_TRUE(running.get().success);
  EXPECT_FALSE(service.rebuild_in_progress());
}

}  // namespace docqa_tests
