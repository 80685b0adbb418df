#include <gtest/gtest.h>

#include "./src/sim/PATTERNS.h"
#include "./src/sim/ERRORS.h"

TEST(PatternCatalogTest, HoldsFourteenPatternsInOrder) {
  const std::vector<std::string> expected = {
      "block", "beehive", "loaf", "boat", "tub",
      "blinker", "toad", "beacon", "pulsar", "pentadecathlon",
      "glider", "lwss", "mwss", "hwss"};
  EXPECT_EQ(patternNames(), expected);
}

TEST(PatternCatalogTest, CellCounts) {
  EXPECT_EQ(findPattern("block").cells.size(), 4u);
  EXPECT_EQ(findPattern("blinker").cells.size(), 3u);
  EXPECT_EQ(findPattern("glider").cells.size(), 5u);
  EXPECT_EQ(findPattern("pulsar").cells.size(), 48u);
  EXPECT_EQ(findPattern("hwss").cells.size(), 13u);
}

TEST(PatternCatalogTest, UnknownNameThrows) {
  EXPECT_THROW(findPattern("nonexistent"), PatternNotFound);
  EXPECT_THROW(findPattern("Glider"), PatternNotFound);

  try {
    findPattern("spaceship");
    FAIL() << "expected PatternNotFound";
  } catch (const PatternNotFound& e) {
    EXPECT_EQ(e.name(), "spaceship");
  }
}

TEST(PatternCatalogTest, Bounds) {
  PatternBounds b = patternBounds(findPattern("pulsar"));
  EXPECT_EQ(b.lo, ivec2(0, 0));
  EXPECT_EQ(b.hi, ivec2(12, 12));

  b = patternBounds(findPattern("blinker"));
  EXPECT_EQ(b.lo, ivec2(0, 0));
  EXPECT_EQ(b.hi, ivec2(2, 0));

  b = patternBounds(Pattern{"offset", {ivec2(-2, 3), ivec2(4, -1)}});
  EXPECT_EQ(b.lo, ivec2(-2, -1));
  EXPECT_EQ(b.hi, ivec2(4, 3));
}
