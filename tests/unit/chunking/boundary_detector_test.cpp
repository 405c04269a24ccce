#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "../../common/utilities_test.hpp"
#include "statute_core/chunking/boundary_detector.hpp"

namespace statute_core {

using statute_tests::TestUtilities;
using ::testing::ElementsAre;

namespace {

ChunkingConfig sizes(int target, int max) {
  ChunkingConfig config;
  config.target_words = target;
  config.max_words = max;
  config.overlap_sentences = 0;
  return config;
}

}  // namespace

TEST(StructuralBoundaryDetectorTest, EmptyInputHasOnlyTheLeadingBoundary) {
  StructuralBoundaryDetector detector(sizes(10, 20));

  EXPECT_THAT(detector.find_boundaries({}), ElementsAre(0u));
}

TEST(StructuralBoundaryDetectorTest, SingleSentenceIsOneChunk) {
  StructuralBoundaryDetector detector(sizes(10, 20));

  EXPECT_THAT(detector.find_boundaries(TestUtilities::create_sentences({4})), ElementsAre(0u, 1u));
}

TEST(StructuralBoundaryDetectorTest, CutsBeforeASentenceThatWouldOverflow) {
  StructuralBoundaryDetector detector(sizes(10, 12));

  auto boundaries = detector.find_boundaries(TestUtilities::create_sentences({5, 5, 5, 5}));

  EXPECT_THAT(boundaries, ElementsAre(0u, 2u, 4u));
}

TEST(StructuralBoundaryDetectorTest, ForcesBoundaryWhenMaxIsReached) {
  StructuralBoundaryDetector detector(sizes(12, 12));

  auto boundaries = detector.find_boundaries(TestUtilities::create_sentences({6, 6, 6}));

  EXPECT_THAT(boundaries, ElementsAre(0u, 2u, 3u));
}

TEST(StructuralBoundaryDetectorTest, OversizedSentenceBecomesItsOwnChunk) {
  StructuralBoundaryDetector detector(sizes(8, 12));

  auto boundaries = detector.find_boundaries(TestUtilities::create_sentences({3, 30, 3}));

  EXPECT_THAT(boundaries, ElementsAre(0u, 1u, 2u, 3u));
}

TEST(StructuralBoundaryDetectorTest, ParagraphStartIsASoftBoundaryOnceTargetIsReached) {
  StructuralBoundaryDetector detector(sizes(8, 100));
  auto sentences = TestUtilities::create_sentences({5, 5, 5, 5});
  sentences[2].starts_paragraph = true;

  EXPECT_THAT(detector.find_boundaries(sentences), ElementsAre(0u, 2u, 4u));
}

TEST(StructuralBoundaryDetectorTest, ParagraphStartBelowTargetIsIgnored) {
  StructuralBoundaryDetector detector(sizes(20, 100));
  auto sentences = TestUtilities::create_sentences({5, 5, 5, 5});
  sentences[1].starts_paragraph = true;

  EXPECT_THAT(detector.find_boundaries(sentences), ElementsAre(0u, 4u));
}

TEST(StructuralBoundaryDetectorTest, SectionHeaderIsASoftBoundary) {
  StructuralBoundaryDetector detector(sizes(4, 100));
  std::vector<Sentence> sentences = {
      {"Fences are limited to six feet in height.", 0, true},
      {"12.3 - Accessory Structures", 42, false},
      {"Sheds must sit behind the house.", 70, false},
  };

  EXPECT_THAT(detector.find_boundaries(sentences), ElementsAre(0u, 1u, 3u));
}

TEST(StructuralBoundaryDetectorTest, RecognisesSectionHeaders) {
  EXPECT_TRUE(StructuralBoundaryDetector::is_section_header("ARTICLE IV - ZONING DISTRICTS"));
  EXPECT_TRUE(StructuralBoundaryDetector::is_section_header("ARTICLE II. - DEFINITIONS"));
  EXPECT_TRUE(StructuralBoundaryDetector::is_section_header("12.3 - Setbacks"));
  EXPECT_TRUE(StructuralBoundaryDetector::is_section_header("12.3. \xE2\x80\x94 Setbacks"));
  EXPECT_FALSE(StructuralBoundaryDetector::is_section_header("12.3 Setbacks"));
  EXPECT_FALSE(StructuralBoundaryDetector::is_section_header("Article iv - zoning"));
  EXPECT_FALSE(StructuralBoundaryDetector::is_section_header("See 12.3 - Setbacks"));
}

TEST(StructuralBoundaryDetectorTest, RejectsInvalidSizeBounds) {
  EXPECT_THROW(StructuralBoundaryDetector(sizes(30, 20)), std::invalid_argument);
  EXPECT_THROW(StructuralBoundaryDetector(sizes(0, 20)), std::invalid_argument);
}

TEST(StructuralBoundaryDetectorTest, NoChunkExceedsMaxUnlessSingleton) {
  StructuralBoundaryDetector detector(sizes(15, 25));
  const std::vector<int> counts = {3, 9, 14, 2, 26, 7, 7, 7, 1, 12, 12, 4, 30, 5};
  auto sentences = TestUtilities::create_sentences(counts);

  auto boundaries = detector.find_boundaries(sentences);

  ASSERT_EQ(boundaries.front(), 0u);
  ASSERT_EQ(boundaries.back(), counts.size());
  for (size_t b = 0; b + 1 < boundaries.size(); ++b) {
    ASSERT_LT(boundaries[b], boundaries[b + 1]);
    int words = 0;
    for (size_t i = boundaries[b]; i < boundaries[b + 1]; ++i) {
      words += counts[i];
    }
    if (boundaries[b + 1] - boundaries[b] > 1) {
      EXPECT_LE(words, 25) << "chunk " << b;
    }
  }
}

class SemanticBoundaryDetectorTest : public statute_tests::DatabaseTestBase {};

TEST_F(SemanticBoundaryDetectorTest, CutsWhereNeighbourSimilarityDrops) {
  ChunkingConfig config = sizes(1, 100);
  config.semantic_threshold = 0.5f;
  SemanticBoundaryDetector detector(config, *embedding_service_);
  std::vector<Sentence> sentences = {
      {"Zoning setbacks apply to lots.", 0, true},
      {"Zoning setbacks apply to parcels.", 31, false},
      {"Dogs must be leashed in parks.", 65, false},
  };

  EXPECT_THAT(detector.find_boundaries(sentences), ElementsAre(0u, 2u, 3u));
  EXPECT_EQ(detector.name(), "semantic");
}

TEST_F(SemanticBoundaryDetectorTest, ZeroThresholdNeverCutsEarly) {
  ChunkingConfig config = sizes(1, 100);
  config.semantic_threshold = 0.0f;
  SemanticBoundaryDetector detector(config, *embedding_service_);

  auto boundaries = detector.find_boundaries(TestUtilities::create_sentences({5, 5, 5}));

  EXPECT_THAT(boundaries, ElementsAre(0u, 3u));
}

TEST_F(SemanticBoundaryDetectorTest, EmbedsAllSentencesInOneBatchCall) {
  ChunkingConfig config = sizes(10, 100);
  SemanticBoundaryDetector detector(config, *embedding_service_);

  detector.find_boundaries(TestUtilities::create_sentences({3, 4, 5, 6}));

  // Batch size in the fixture is 8, so four sentences fit one model call
  EXPECT_EQ(provider_->calls.load(), 1);
  EXPECT_EQ(provider_->texts_embedded.load(), 4);
}

}  // namespace statute_core
