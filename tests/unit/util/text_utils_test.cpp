#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "statute_core/util/text_utils.hpp"
#include "statute_core/util/vector_math.hpp"

namespace statute_core {

TEST(TextUtilsTest, Sha256MatchesKnownDigest) {
  EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(TextUtilsTest, CountsWhitespaceSeparatedWords) {
  EXPECT_EQ(count_words(""), 0);
  EXPECT_EQ(count_words("  \n\t "), 0);
  EXPECT_EQ(count_words("Fla. Stat. permits variance requests."), 5);
  EXPECT_EQ(count_words("a\nb\tc  d"), 4);
}

TEST(TextUtilsTest, CountsCodePointsNotBytes) {
  EXPECT_EQ(count_code_points("abc"), 3);
  EXPECT_EQ(count_code_points("\xC2\xA7" "101"), 4);
  EXPECT_EQ(count_code_points("\xFF\xFE"), 2);
}

TEST(TextUtilsTest, TrimsAndJoins) {
  EXPECT_EQ(trim("  Sec. 4.2  \n"), "Sec. 4.2");
  EXPECT_EQ(trim("   "), "");
  EXPECT_EQ(join({"a", "b", "c"}, " "), "a b c");
  EXPECT_EQ(join({}, ", "), "");
}

TEST(TextUtilsTest, DetectsLowercaseStart) {
  EXPECT_TRUE(starts_with_lowercase("permits variance"));
  EXPECT_FALSE(starts_with_lowercase("Permits"));
  EXPECT_FALSE(starts_with_lowercase("\xC2\xA7 101"));
  EXPECT_FALSE(starts_with_lowercase(""));
}

TEST(VectorMathTest, CosineSimilarity) {
  EXPECT_FLOAT_EQ(cosine_similarity({1, 0}, {1, 0}), 1.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({1, 0}, {0, 2}), 0.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({1, 1}, {-1, -1}), -1.0f);
  EXPECT_FLOAT_EQ(cosine_similarity({0, 0}, {1, 0}), 0.0f);
  EXPECT_THROW(cosine_similarity({1, 0}, {1, 0, 0}), std::invalid_argument);
}

TEST(VectorMathTest, NormalizesToUnitLength) {
  std::vector<float> vec = {3.0f, 4.0f};
  l2_normalize(vec);
  EXPECT_FLOAT_EQ(vec[0], 0.6f);
  EXPECT_FLOAT_EQ(vec[1], 0.8f);

  std::vector<float> zero = {0.0f, 0.0f};
  l2_normalize(zero);
  EXPECT_EQ(zero, std::vector<float>({0.0f, 0.0f}));
}

}  // namespace statute_core
