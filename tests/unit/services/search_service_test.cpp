#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "statute_core/services/search_service.hpp"

namespace statute_core {

using statute_tests::TestUtilities;

class SearchServiceTest : public statute_tests::DatabaseTestBase {
 protected:
  void SetUp() override {
    DatabaseTestBase::SetUp();
    search_service_ = std::make_shared<SearchService>(chunk_store_, embedding_service_);
  }

  void TearDown() override {
    search_service_.reset();
    DatabaseTestBase::TearDown();
  }

  // Stores one chunk per text, embedded through the mock model
  void store(const std::string& doc_id, const std::string& jurisdiction,
             const std::vector<std::string>& texts, const std::string& region = "ZZ") {
    std::vector<Chunk> chunks;
    for (size_t i = 0; i < texts.size(); ++i) {
      chunks.push_back(TestUtilities::create_test_chunk(doc_id, static_cast<int>(i), texts[i],
                                                        embedding_service_->embed(texts[i]),
                                                        jurisdiction, region));
    }
    chunk_store_->replace_document_chunks(
        TestUtilities::create_test_document(doc_id, jurisdiction, region), 0, chunks);
  }

  void store_two_towns() {
    store("springfield-fences", "Springfield",
          {"Fence height is limited to six feet in residential zones.",
           "Parking is prohibited on lawns."});
    store("shelbyville-fences", "Shelbyville",
          {"Fence height in residential zones may not exceed four feet."});
  }

  std::shared_ptr<SearchService> search_service_;
};

TEST_F(SearchServiceTest, JurisdictionFilterKeepsOtherTownsOut) {
  store_two_towns();

  auto hits = search_service_->search("fence height residential", std::string("Springfield"), "ZZ");

  ASSERT_FALSE(hits.empty());
  for (const auto& hit : hits) {
    EXPECT_EQ(hit.jurisdiction, "Springfield");
  }
  EXPECT_EQ(hits[0].source_document_id, "springfield-fences");
  EXPECT_EQ(hits[0].chunk_number, 0);
  EXPECT_EQ(hits[0].content, "Fence height is limited to six feet in residential zones.");
  EXPECT_EQ(hits[0].section_id, "UNKNOWN");
}

TEST_F(SearchServiceTest, WithoutJurisdictionEveryTownInTheRegionIsSearched) {
  store_two_towns();

  auto hits = search_service_->search("fence height residential", std::nullopt, "ZZ", 10);

  ASSERT_EQ(hits.size(), 3u);
  bool saw_shelbyville = false;
  for (size_t i = 0; i < hits.size(); ++i) {
    saw_shelbyville |= hits[i].jurisdiction == "Shelbyville";
    EXPECT_GE(hits[i].relevance_score, 0.0f);
    EXPECT_LE(hits[i].relevance_score, 1.0f);
    if (i > 0) {
      EXPECT_LE(hits[i].relevance_score, hits[i - 1].relevance_score);
    }
  }
  EXPECT_TRUE(saw_shelbyville);
  EXPECT_TRUE(search_service_->search("fence height", std::nullopt, "YY").empty());
}

TEST_F(SearchServiceTest, RaisingMinRelevanceKeepsAPrefix) {
  store_two_towns();

  auto all = search_service_->search("fence height residential", std::nullopt, "ZZ", 10);
  ASSERT_EQ(all.size(), 3u);
  const float cutoff = all[1].relevance_score;

  auto strict = search_service_->search("fence height residential", std::nullopt, "ZZ", 10, cutoff);

  ASSERT_LE(strict.size(), all.size());
  ASSERT_GE(strict.size(), 2u);
  for (size_t i = 0; i < strict.size(); ++i) {
    EXPECT_EQ(strict[i].source_document_id, all[i].source_document_id);
    EXPECT_EQ(strict[i].chunk_number, all[i].chunk_number);
    EXPECT_GE(strict[i].relevance_score, cutoff);
  }
}

TEST_F(SearchServiceTest, TopKLimitsResults) {
  store_two_towns();

  EXPECT_EQ(search_service_->search("fence", std::nullopt, "ZZ", 1).size(), 1u);
  EXPECT_TRUE(search_service_->search("fence", std::nullopt, "ZZ", 0).empty());
}

TEST_F(SearchServiceTest, RejectsEmptyQueryOrRegion) {
  EXPECT_THROW(search_service_->search("", std::nullopt, "ZZ"), SearchInputError);
  EXPECT_THROW(search_service_->search(" \t ", std::nullopt, "ZZ"), SearchInputError);
  EXPECT_THROW(search_service_->search("fence", std::nullopt, ""), SearchInputError);
  EXPECT_THROW(search_service_->list_jurisdictions(""), SearchInputError);
}

TEST_F(SearchServiceTest, EmptyIndexGivesNoResults) {
  EXPECT_TRUE(search_service_->search("fence height", std::nullopt, "ZZ").empty());
}

TEST_F(SearchServiceTest, QueriesAreCachedSeparatelyFromPassages) {
  store_two_towns();
  const int before = provider_->texts_embedded.load();

  search_service_->search("Parking is prohibited on lawns.", std::nullopt, "ZZ");
  search_service_->search("Parking is prohibited on lawns.", std::nullopt, "ZZ");

  EXPECT_EQ(provider_->texts_embedded.load(), before + 1);
}

TEST_F(SearchServiceTest, ListsJurisdictions) {
  store_two_towns();

  auto counts = search_service_->list_jurisdictions("ZZ");

  ASSERT_EQ(counts.size(), 2u);
  EXPECT_EQ(counts[0].jurisdiction, "Springfield");
  EXPECT_EQ(counts[0].chunk_count, 2);
  EXPECT_EQ(counts[1].jurisdiction, "Shelbyville");
  EXPECT_EQ(counts[1].chunk_count, 1);
}

TEST(SearchServiceStandaloneTest, UnconfiguredServiceThrows) {
  SearchService service(nullptr, nullptr);

  EXPECT_THROW(service.search("fence", std::nullopt, "ZZ"), SearchServiceError);
  EXPECT_THROW(service.list_jurisdictions("ZZ"), SearchServiceError);
}

}  // namespace statute_core
