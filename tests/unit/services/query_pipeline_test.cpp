#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "docqa_core/services/query_pipeline.hpp"
#include "mocks_test.hpp"
#include "utilities_test.hpp"

namespace docqa_tests {

using namespace docqa_core;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class QueryPipelineTest : public ::testing::Test {
 protected:
  static constexpr const char *AUTH_QUESTION = "Which authentication method is mentioned?";
  static constexpr const char *FRANCE_QUESTION = "What is the capital of France?";

  void SetUp() override {
    std::vector<Document> documents;
    for (const auto &[path, markdown] : TestUtilities::sample_corpus()) {
      documents.push_back(TestUtilities::create_test_document(path, markdown));
    }
    IndexManifest manifest;
    manifest.generation = "test";
    registry_.swap(std::make_shared<const IndexSnapshot>(
        IndexSnapshot{TestUtilities::create_hashed_index(documents), manifest}));

    ON_CALL(generator_, generate(_, HasSubstr("OAuth2")))
        .WillByDefault(Return("Authentication uses OAuth2 with Password (and hashing), Bearer "
                              "with JWT tokens."));
  }

  QueryPipeline make_pipeline() {
    return QueryPipeline(registry_, embedder_, generator_, RefusalPolicy());
  }

  IndexRegistry registry_;
  NiceMock<MockEmbeddingGateway> embedder_;
  NiceMock<MockGenerationGateway> generator_;
};

TEST_F(QueryPipelineTest, GroundedQuestion_IsAnsweredWithCitation) {
  EXPECT_CALL(embedder_, embed(AUTH_QUESTION, EmbeddingRole::QUERY)).Times(1);
  EXPECT_CALL(generator_, generate(AUTH_QUESTION, HasSubstr("[authentication.md § Authentication]")))
      .Times(1);

  QueryResult result = make_pipeline().query(AUTH_QUESTION);

  EXPECT_EQ(result.outcome(), QueryOutcome::ANSWERED);
  EXPECT_FALSE(result.refused);
  EXPECT_EQ(result.reason, RefusalReason::NONE);
  EXPECT_THAT(result.answer, HasSubstr("OAuth2"));
  EXPECT_THAT(result.answer, HasSubstr("JWT"));
  EXPECT_EQ(result.sources, (std::vector<std::string>{"authentication.md"}));
  ASSERT_FALSE(result.retrieved.empty());
  EXPECT_EQ(result.retrieved[0].chunk.source_path, "authentication.md");
  EXPECT_GE(result.retrieved[0].score, 0.35f);
}

TEST_F(QueryPipelineTest, UngroundedQuestion_IsRefusedWithoutGeneration) {
  EXPECT_CALL(generator_, generate(_, _)).Times(0);

  QueryResult result = make_pipeline().query(FRANCE_QUESTION);

  EXPECT_EQ(result.outcome(), QueryOutcome::REFUSED);
  EXPECT_EQ(result.reason, RefusalReason::NO_RELEVANT_CONTEXT);
  EXPECT_EQ(result.answer, "Not found in the documentation.");
  EXPECT_TRUE(result.sources.empty());
  EXPECT_TRUE(result.context.empty());
}

TEST_F(QueryPipelineTest, RepeatedQuery_IsIdentical) {
  QueryPipeline pipeline = make_pipeline();
  QueryResult first = pipeline.query(AUTH_QUESTION);
  QueryResult second = pipeline.query(AUTH_QUESTION);

  EXPECT_EQ(first.answer, second.answer);
  EXPECT_EQ(first.sources, second.sources);
  EXPECT_EQ(first.context, second.context);
  ASSERT_EQ(first.retrieved.size(), second.retrieved.size());
  for (size_t i = 0; i < first.retrieved.size(); ++i) {
    EXPECT_EQ(first.retrieved[i].chunk.id, second.retrieved[i].chunk.id);
    EXPECT_FLOAT_EQ(first.retrieved[i].score, second.retrieved[i].score);
  }
}

TEST_F(QueryPipelineTest, ThresholdOverride_CanRefuseAGroundedQuestion) {
  EXPECT_CALL(generator_, generate(_, _)).Times(0);

  QueryResult result = make_pipeline().query(AUTH_QUESTION, 3, 0.95f);

  EXPECT_EQ(result.reason, RefusalReason::NO_RELEVANT_CONTEXT);
  EXPECT_TRUE(result.sources.empty());
}

TEST_F(QueryPipelineTest, ThresholdOverride_CanAdmitAWeakMatch) {
  EXPECT_CALL(generator_, generate(FRANCE_QUESTION, _)).Times(1);

  QueryResult result = make_pipeline().query(FRANCE_QUESTION, 3, -1.0f);

  EXPECT_EQ(result.outcome(), QueryOutcome::ANSWERED);
  EXPECT_FALSE(result.sources.empty());
}

TEST_F(QueryPipelineTest, BudgetTooSmallForAnyText_IsRefusedWithoutGeneration) {
  EXPECT_CALL(generator_, generate(_, _)).Times(0);

  QueryOptions options;
  options.context_budget_chars = 10;
  QueryResult result = make_pipeline().query(AUTH_QUESTION, options);

  EXPECT_EQ(result.outcome(), QueryOutcome::REFUSED);
  EXPECT_EQ(result.reason, RefusalReason::NO_RELEVANT_CONTEXT);
  EXPECT_TRUE(result.sources.empty());
  EXPECT_TRUE(result.context.empty());
  ASSERT_FALSE(result.retrieved.empty());
  EXPECT_EQ(result.retrieved[0].chunk.source_path, "authentication.md");
}

TEST_F(QueryPipelineTest, ModelSelfReportedAbsence_IsRefused) {
  ON_CALL(generator_, generate(_, _)).WillByDefault(Return("Not found in the documentation."));

  QueryResult result = make_pipeline().query(AUTH_QUESTION);

  EXPECT_EQ(result.outcome(), QueryOutcome::REFUSED);
  EXPECT_EQ(result.reason, RefusalReason::MODEL_DETECTED_ABSENCE);
  EXPECT_TRUE(result.sources.empty());
  EXPECT_FALSE(result.context.empty());
}

TEST_F(QueryPipelineTest, EmptyGeneration_IsRefused) {
  ON_CALL(generator_, generate(_, _)).WillByDefault(Return("   \n"));

  QueryResult result = make_pipeline().query(AUTH_QUESTION);

  EXPECT_EQ(result.reason, RefusalReason::MODEL_DETECTED_ABSENCE);
}

TEST_F(QueryPipelineTest, AnswerIsTrimmed) {
  ON_CALL(generator_, generate(_, _)).WillByDefault(Return("\n  OAuth2 and JWT.  \n"));

  QueryResult result = make_pipeline().query(AUTH_QUESTION);

  EXPECT_EQ(result.answer, "OAuth2 and JWT.");
}

TEST_F(QueryPipelineTest, EmptyIndex_IsRefusedWithoutEmbedding) {
  IndexRegistry empty_registry;
  EXPECT_CALL(embedder_, embed(_, _)).Times(0);
  EXPECT_CALL(generator_, generate(_, _)).Times(0);

  QueryPipeline pipeline(empty_registry, embedder_, generator_, RefusalPolicy());
  QueryResult result = pipeline.query(AUTH_QUESTION);

  EXPECT_EQ(result.reason, RefusalReason::EMPTY_INDEX);
  EXPECT_TRUE(result.refused);
}

TEST_F(QueryPipelineTest, EmbeddingFailure_IsRefusedAsRetrievalFailed) {
  ON_CALL(embedder_, embed(_, _)).WillByDefault(Throw(EmbeddingUnavailable("ollama timed out")));
  EXPECT_CALL(generator_, generate(_, _)).Times(0);

  QueryResult result = make_pipeline().query(AUTH_QUESTION);

  EXPECT_EQ(result.reason, RefusalReason::RETRIEVAL_FAILED);
  EXPECT_THAT(result.error, HasSubstr("ollama timed out"));
  EXPECT_TRUE(result.sources.empty());
}

TEST_F(QueryPipelineTest, GenerationFailure_IsRefusedWithoutRetry) {
  EXPECT_CALL(generator_, generate(_, _))
      .WillOnce(Throw(GenerationUnavailable("model not loaded")));

  QueryResult result = make_pipeline().query(AUTH_QUESTION);

  EXPECT_EQ(result.reason, RefusalReason::GENERATION_FAILED);
  EXPECT_EQ(result.answer, "Not found in the documentation.");
  EXPECT_THAT(result.error, HasSubstr("model not loaded"));
  EXPECT_TRUE(result.sources.empty());
}

TEST_F(QueryPipelineTest, SwapDuringQuery_DoesNotAffectRunningQuery) {
  ON_CALL(generator_, generate(_, _)).WillByDefault([this](const std::string &, const std::string &) {
    registry_.swap(std::make_shared<const IndexSnapshot>(
        IndexSnapshot{std::make_shared<const VectorIndex>(), IndexManifest{}}));
    return std::string("OAuth2 with JWT tokens.");
  });

  QueryResult result = make_pipeline().query(AUTH_QUESTION);

  EXPECT_EQ(result.outcome(), QueryOutcome::ANSWERED);
  EXPECT_EQ(result.sources, (std::vector<std::string>{"authentication.md"}));
  EXPECT_FALSE(registry_.has_index());
}

TEST_F(QueryPipelineTest, InvalidInput_Throws) {
  QueryPipeline pipeline = make_pipeline();
  QueryOptions options;

  EXPECT_THROW(pipeline.query("   ", options), std::invalid_argument);

  options.top_k = 0;
  EXPECT_THROW(pipeline.query(AUTH_QUESTION, options), std::invalid_argument);

  options.top_k = 3;
  options.context_budget_chars = 0;
  EXPECT_THROW(pipeline.query(AUTH_QUESTION, options), std::invalid_argument);
}

}  // namespace docqa_tests
