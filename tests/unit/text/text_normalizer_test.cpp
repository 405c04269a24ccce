#include <gtest/gtest.h>

#include <string>

#include "statute_core/text/text_normalizer.hpp"

namespace statute_core {

class TextNormalizerTest : public ::testing::Test {
 protected:
  TextNormalizer normalizer_;
};

TEST_F(TextNormalizerTest, CollapsesHorizontalWhitespaceAndBlankRuns) {
  const std::string raw = "  Setbacks \t apply  to\r\n\r\n\r\n\r\nall   lots.  ";

  EXPECT_EQ(normalizer_.normalize(raw), "Setbacks apply to\n\nall lots.");
}

TEST_F(TextNormalizerTest, TrimsSpacesAroundSingleNewlines) {
  EXPECT_EQ(normalizer_.normalize("Line one   \n   line two"), "Line one\nline two");
}

TEST_F(TextNormalizerTest, ConvertsCurlyQuotesToAscii) {
  const std::string raw = "\xE2\x80\x9CLot\xE2\x80\x9D means the owner\xE2\x80\x99s parcel";

  EXPECT_EQ(normalizer_.normalize(raw), "\"Lot\" means the owner's parcel");
}

TEST_F(TextNormalizerTest, RewritesDescriptiveImagesAndDropsDecorativeOnes) {
  const std::string raw =
      "See ![Zoning map of the downtown district](map.png) and ![logo](l.png) and "
      "![Municipal seal icon graphic](seal.png).";

  EXPECT_EQ(normalizer_.normalize(raw),
            "See [Image: Zoning map of the downtown district] and and .");
}

TEST_F(TextNormalizerTest, StripsNavigationBoilerplate) {
  const std::string raw =
      "Sec. 4.2 Fences. Share Link to section Print Compare versions Fences shall not exceed six "
      "feet. Loading, please wait";

  const std::string normalized = normalizer_.normalize(raw);

  EXPECT_EQ(normalized.find("Share Link"), std::string::npos);
  EXPECT_EQ(normalized.find("Compare versions"), std::string::npos);
  EXPECT_EQ(normalized.find("Loading"), std::string::npos);
  EXPECT_NE(normalized.find("Fences shall not exceed six feet."), std::string::npos);
}

TEST_F(TextNormalizerTest, ReplacesInvalidUtf8) {
  const std::string raw = std::string("Section ") + '\xFF' + " applies";

  const std::string normalized = normalizer_.normalize(raw);

  EXPECT_NE(normalized.find("\xEF\xBF\xBD"), std::string::npos);
  EXPECT_EQ(normalized.find('\xFF'), std::string::npos);
}

TEST_F(TextNormalizerTest, WhitespaceOnlyInputBecomesEmpty) {
  EXPECT_TRUE(normalizer_.normalize(" \n\t\r\n ").empty());
  EXPECT_TRUE(normalizer_.normalize("").empty());
}

TEST_F(TextNormalizerTest, RemovesShowChangesUpToTheNextMore) {
  const std::string raw = "Sec. 2.1 Purpose. Show Changes 3 more The board shall adopt rules.";

  EXPECT_EQ(normalizer_.normalize(raw), "Sec. 2.1 Purpose. The board shall adopt rules.");
}

TEST_F(TextNormalizerTest, PrintSectionMarkerMustCloseOnTheSameLine) {
  const std::string same_line = "Intro. Print section | Email section Body.";
  const std::string split = "Intro. Print section\nEmail section Body.";

  EXPECT_EQ(normalizer_.normalize(same_line), "Intro. Body.");
  EXPECT_EQ(normalizer_.normalize(split), split);
}

TEST_F(TextNormalizerTest, UnterminatedShowChangesInLongDocumentIsKept) {
  std::string raw = "Sec. 1.1 - Purpose. Show Changes ";
  while (raw.size() < 100000) {
    raw += "The board shall adopt rules. ";
  }

  const std::string normalized = normalizer_.normalize(raw);

  EXPECT_EQ(normalized.rfind("Sec. 1.1 - Purpose. Show Changes The board", 0), 0u);
  EXPECT_EQ(normalized.size(), raw.size() - 1);
}

TEST_F(TextNormalizerTest, UnterminatedShareLinkInLongDocumentIsKept) {
  std::string raw = "Sec. 1.2 - Scope. Share Link to section ";
  while (raw.size() < 100000) {
    raw += "Permits expire after one year.\n";
  }

  const std::string normalized = normalizer_.normalize(raw);

  EXPECT_EQ(normalized.rfind("Sec. 1.2 - Scope. Share Link to section\nPermits", 0), 0u);
  EXPECT_NE(normalized.find("Permits expire after one year."), std::string::npos);
}

TEST_F(TextNormalizerTest, LongWhitespaceRunCollapsesToOneSpace) {
  const std::string raw = "Setbacks" + std::string(100000, ' ') + "apply.";

  EXPECT_EQ(normalizer_.normalize(raw), "Setbacks apply.");
}

TEST_F(TextNormalizerTest, IsIdempotent) {
  const std::string raw = "A  \xE2\x80\x9Cquoted\xE2\x80\x9D term.\n\n\n\nNext   paragraph.";
  const std::string once = normalizer_.normalize(raw);

  EXPECT_EQ(normalizer_.normalize(once), once);
}

}  // namespace statute_core
