#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "statute_core/services/compression_service.hpp"

namespace statute_core {

class CompressionServiceTest : public ::testing::Test {
 protected:
  // Ordinance-like text with the repetition real codes have
  static std::string ordinance_text(size_t sections) {
    std::string text;
    for (size_t i = 1; i <= sections; ++i) {
      text += "Sec. " + std::to_string(i) +
              ". No structure shall be built within 10 feet of a property line unless a "
              "variance is granted by the Zoning Board of Appeals.\n\n";
    }
    return text;
  }
};

TEST_F(CompressionServiceTest, ChunkTextSurvivesStorageEncoding) {
  const std::string text =
      "\xC2\xA7" "101. \"Lot\" means a parcel \xE2\x80\x94 see Fla. Stat. \xC2\xA7 163.3202.";

  EXPECT_EQ(CompressionService::decompress(CompressionService::compress(text)), text);
}

TEST_F(CompressionServiceTest, RepetitiveOrdinanceTextShrinks) {
  const std::string text = ordinance_text(200);

  std::vector<char> frame = CompressionService::compress(text);

  EXPECT_LT(frame.size(), text.size() / 4);
  EXPECT_EQ(CompressionService::decompress(frame), text);
}

TEST_F(CompressionServiceTest, DefaultLevelIsThree) {
  const std::string text = ordinance_text(20);

  EXPECT_EQ(CompressionService::compress(text), CompressionService::compress(text, 3));
}

TEST_F(CompressionServiceTest, EmptyTextMapsToEmptyFrame) {
  EXPECT_TRUE(CompressionService::compress("").empty());
  EXPECT_TRUE(CompressionService::decompress({}).empty());
}

TEST_F(CompressionServiceTest, RejectsOutOfRangeLevel) {
  EXPECT_THROW(CompressionService::compress("text", 1000), CompressionError);
}

TEST_F(CompressionServiceTest, RejectsDataThatIsNotAFrame) {
  std::vector<char> garbage = {'H', 'e', 'l', 'l', 'o'};

  EXPECT_THROW(CompressionService::decompress(garbage), CompressionError);
}

TEST_F(CompressionServiceTest, RejectsCorruptedHeader) {
  std::vector<char> frame = CompressionService::compress(ordinance_text(3));
  ASSERT_GT(frame.size(), 4u);
  for (int i = 0; i < 4; ++i) {
    frame[i] = static_cast<char>(0xFF);
  }

  EXPECT_THROW(CompressionService::decompress(frame), CompressionError);
}

TEST_F(CompressionServiceTest, RejectsTruncatedFrame) {
  std::vector<char> frame = CompressionService::compress(ordinance_text(50));
  frame.resize(frame.size() / 2);

  EXPECT_THROW(CompressionService::decompress(frame), CompressionError);
}

}  // namespace statute_core
