#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "statute_core/llm/ollama_client.hpp"
#include "statute_core/services/ingestion_service.hpp"

namespace statute_core {

using statute_tests::TestUtilities;
using ::testing::_;
using ::testing::Throw;

class IngestionServiceTest : public statute_tests::DatabaseTestBase {
 protected:
  void SetUp() override {
    DatabaseTestBase::SetUp();
    service_ = std::make_shared<IngestionService>(chunk_store_, embedding_service_);
  }

  void TearDown() override {
    service_.reset();
    DatabaseTestBase::TearDown();
  }

  static ChunkingConfig scenario_config(int max_words, bool semantic = false) {
    ChunkingConfig config;
    config.target_words = 8;
    config.max_words = max_words;
    config.overlap_sentences = 1;
    config.use_semantic_boundaries = semantic;
    return config;
  }

  int ingest_scenario(const ChunkingConfig& config, const std::string& id = "springfield-101") {
    return service_->ingest(id, "Springfield", "ZZ", TestUtilities::scenario_document(), config);
  }

  std::shared_ptr<IngestionService> service_;
};

// The scenario text has 23 words, so a 20-word cap forces the citation sentence
// into a second chunk.
TEST_F(IngestionServiceTest, ScenarioUnderTwentyWordsStoresTwoChunks) {
  EXPECT_EQ(ingest_scenario(scenario_config(20)), 2);

  auto chunks = chunk_store_->get_document_chunks("springfield-101");
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[1].text, "Fla. Stat. permits variance requests.");
  EXPECT_TRUE(chunks[1].has_citation);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.source_document_id, "springfield-101");
    EXPECT_EQ(chunk.jurisdiction, "Springfield");
    EXPECT_EQ(chunk.region, "ZZ");
    EXPECT_EQ(chunk.vector_embedding.size(),
              static_cast<size_t>(statute_tests::MockUtilities::kTestDimension));
  }

  auto record = chunk_store_->get_document("springfield-101");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->version, 1);
  EXPECT_EQ(record->chunk_count, 2);
  EXPECT_EQ(record->model_version, "mock-embed-v1");
}

TEST_F(IngestionServiceTest, ScenarioFitsOneChunkStructurally) {
  EXPECT_EQ(ingest_scenario(scenario_config(25)), 1);

  auto chunks = chunk_store_->get_document_chunks("springfield-101");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].word_count, 23);
  EXPECT_TRUE(chunks[0].has_citation);
  EXPECT_THAT(chunks[0].cross_references, ::testing::Contains("101"));
}

TEST_F(IngestionServiceTest, ScenarioFitsOneChunkSemanticallyAtZeroThreshold) {
  ChunkingConfig config = scenario_config(25, /*semantic*/ true);
  config.semantic_threshold = 0.0f;

  EXPECT_EQ(ingest_scenario(config), 1);
  EXPECT_EQ(chunk_store_->get_document_chunks("springfield-101").size(), 1u);
}

TEST_F(IngestionServiceTest, EmptyDocumentWritesNothing) {
  EXPECT_EQ(service_->ingest("blank", "Springfield", "ZZ", "  \n\t ", scenario_config(20)), 0);

  EXPECT_FALSE(chunk_store_->get_document("blank").has_value());
  EXPECT_EQ(provider_->calls.load(), 0);
}

TEST_F(IngestionServiceTest, MissingRegionIsAnInputError) {
  try {
    service_->ingest("doc", "Springfield", "", "Some text.", scenario_config(20));
    FAIL() << "Expected IngestionError";
  } catch (const IngestionError& e) {
    EXPECT_EQ(e.kind(), IngestionError::Kind::Input);
    EXPECT_EQ(e.stage(), "validate");
  }
}

TEST_F(IngestionServiceTest, InvalidConfigIsAConfigurationError) {
  ChunkingConfig config;
  config.target_words = 600;
  config.max_words = 500;

  try {
    service_->ingest("doc", "Springfield", "ZZ", "Some text.", config);
    FAIL() << "Expected IngestionError";
  } catch (const IngestionError& e) {
    EXPECT_EQ(e.kind(), IngestionError::Kind::Configuration);
    EXPECT_EQ(e.stage(), "config");
    EXPECT_EQ(e.document_id(), "doc");
  }
}

TEST_F(IngestionServiceTest, NanThresholdIsAConfigurationError) {
  ChunkingConfig config = scenario_config(20, /*semantic*/ true);
  config.semantic_threshold = std::numeric_limits<float>::quiet_NaN();

  EXPECT_THROW(config.validate(), std::invalid_argument);
  try {
    service_->ingest("doc", "Springfield", "ZZ", "Some text.", config);
    FAIL() << "Expected IngestionError";
  } catch (const IngestionError& e) {
    EXPECT_EQ(e.kind(), IngestionError::Kind::Configuration);
    EXPECT_EQ(e.stage(), "config");
  }
  EXPECT_FALSE(chunk_store_->get_document("doc").has_value());
}

TEST_F(IngestionServiceTest, ReingestingIsDeterministicAndServedFromCache) {
  ChunkingConfig config = scenario_config(20, /*semantic*/ true);
  ingest_scenario(config);
  auto first = chunk_store_->get_document_chunks("springfield-101");
  const int embedded = provider_->texts_embedded.load();

  ingest_scenario(config);
  auto second = chunk_store_->get_document_chunks("springfield-101");

  EXPECT_EQ(provider_->texts_embedded.load(), embedded);
  EXPECT_EQ(chunk_store_->current_version("springfield-101"), 2);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].content_hash, second[i].content_hash);
    EXPECT_EQ(first[i].vector_embedding, second[i].vector_embedding);
    EXPECT_FLOAT_EQ(first[i].coherence_score, second[i].coherence_score);
  }
}

TEST_F(IngestionServiceTest, ModelFailureIsAnEmbeddingError) {
  EXPECT_CALL(*provider_, embed(_)).WillOnce(Throw(OllamaError("connection refused")));

  try {
    ingest_scenario(scenario_config(25));
    FAIL() << "Expected IngestionError";
  } catch (const IngestionError& e) {
    EXPECT_EQ(e.kind(), IngestionError::Kind::Embedding);
    EXPECT_EQ(e.stage(), "embed");
  }
  EXPECT_FALSE(chunk_store_->get_document("springfield-101").has_value());
}

TEST_F(IngestionServiceTest, ConcurrentWriterCausesAConflict) {
  // Another writer commits the same document while this ingestion is embedding.
  EXPECT_CALL(*provider_, embed(_)).WillOnce([this](const std::vector<std::string>& texts) {
    chunk_store_->replace_document_chunks(TestUtilities::create_test_document("springfield-101"), 0,
                                          {});
    return std::vector<std::vector<float>>(
        texts.size(), statute_tests::MockUtilities::axis_vector(0));
  });

  try {
    ingest_scenario(scenario_config(25));
    FAIL() << "Expected IngestionError";
  } catch (const IngestionError& e) {
    EXPECT_EQ(e.kind(), IngestionError::Kind::Conflict);
    EXPECT_EQ(e.stage(), "persist");
  }
  EXPECT_EQ(chunk_store_->current_version("springfield-101"), 1);
  EXPECT_TRUE(chunk_store_->get_document_chunks("springfield-101").empty());
}

TEST_F(IngestionServiceTest, StoreDimensionMustMatchTheModel) {
  auto narrow_store = std::make_shared<ChunkStore>(*db_manager_, 32);

  EXPECT_THROW({ IngestionService service(narrow_store, embedding_service_); },
               EmbeddingDimensionError);
}

TEST_F(IngestionServiceTest, BatchReportsComeBackInSubmissionOrder) {
  std::vector<SourceDocument> documents = {
      {"doc-a", "Springfield", "ZZ", TestUtilities::scenario_document()},
      {"doc-b", "Shelbyville", "ZZ", "   "},
      {"doc-c", "Springfield", "ZZ", "Parks close at dusk. Dogs must be leashed."},
  };

  auto reports = service_->ingest_batch(documents, scenario_config(20), /*num_workers*/ 2);

  ASSERT_EQ(reports.size(), 3u);
  EXPECT_EQ(reports[0].document_id, "doc-a");
  EXPECT_EQ(reports[0].chunks_written, 2);
  EXPECT_EQ(reports[1].document_id, "doc-b");
  EXPECT_EQ(reports[1].chunks_written, 0);
  EXPECT_EQ(reports[2].document_id, "doc-c");
  EXPECT_EQ(reports[2].chunks_written, 1);
  for (const auto& report : reports) {
    EXPECT_FALSE(report.error.has_value());
  }
}

}  // namespace statute_core
