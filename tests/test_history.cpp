#include <gtest/gtest.h>

#include "./src/sim/HISTORY.h"

#include <algorithm>

// a 16 cell grid with one live cell, its fingerprint is the index itself
static std::vector<GLubyte> single(int index) {
  std::vector<GLubyte> cells(16, CELL_DEAD);
  cells[index] = CELL_ALIVE;
  return cells;
}

TEST(FingerprintTest, PolynomialOverAliveIndices) {
  std::vector<GLubyte> cells(16, CELL_DEAD);
  EXPECT_EQ(fingerprint(cells), 0u);

  cells[0] = CELL_ALIVE;
  cells[5] = CELL_ALIVE;
  EXPECT_EQ(fingerprint(cells), 5u);

  std::fill(cells.begin(), cells.end(), CELL_DEAD);
  cells[1] = CELL_ALIVE;
  cells[2] = CELL_ALIVE;
  EXPECT_EQ(fingerprint(cells), 33u);
}

TEST(FingerprintTest, WrapsModulo32Bits) {
  std::vector<GLubyte> cells(64, CELL_ALIVE);

  uint32_t expected = 0;
  for (uint32_t i = 0; i < 64; i++) expected = expected * 31u + i;
  EXPECT_EQ(fingerprint(cells), expected);
}

TEST(CountAliveTest, UsesByteThreshold) {
  std::vector<GLubyte> cells = { 0, 128, 129, 255, 64, 200 };
  EXPECT_EQ(countAlive(cells), 3);
}

TEST(EndReasonTest, ExactStrings) {
  EXPECT_EQ(endReasonString(EXTINCTION, 0), "EXTINCTION - all cells dead");
  EXPECT_EQ(endReasonString(STABLE, 0), "STABLE STATE - pattern unchanged");
  EXPECT_EQ(endReasonString(PERIODIC, 7), "PERIODIC LOOP - period of 7 generations");
  EXPECT_EQ(endReasonString(RUNNING, 0), "");
}

TEST(TerminationTest, EmptyGridIsExtinct) {
  EngineState state;
  EXPECT_TRUE(detectTermination(state, std::vector<GLubyte>(16, CELL_DEAD)));
  EXPECT_TRUE(state.hasEnded);
  EXPECT_EQ(state.endKind, EXTINCTION);
  EXPECT_EQ(state.endReason, "EXTINCTION - all cells dead");
}

TEST(TerminationTest, RepeatOfLatestIsStable) {
  EngineState state;
  EXPECT_FALSE(detectTermination(state, single(4)));
  EXPECT_TRUE(detectTermination(state, single(4)));
  EXPECT_EQ(state.endKind, STABLE);
  EXPECT_EQ(state.endReason, "STABLE STATE - pattern unchanged");
}

TEST(TerminationTest, RepeatOfOlderIsPeriodic) {
  EngineState state;
  EXPECT_FALSE(detectTermination(state, single(1)));
  EXPECT_FALSE(detectTermination(state, single(2)));
  EXPECT_FALSE(detectTermination(state, single(3)));
  EXPECT_TRUE(detectTermination(state, single(1)));
  EXPECT_EQ(state.endKind, PERIODIC);
  EXPECT_EQ(state.period, 3);
  EXPECT_EQ(state.endReason, "PERIODIC LOOP - period of 3 generations");
}

TEST(TerminationTest, HistoryKeepsTenNewest) {
  EngineState state;
  for (int i = 1; i <= 11; i++)
    EXPECT_FALSE(detectTermination(state, single(i)));
  EXPECT_EQ(state.history.size(), 10u);
  EXPECT_EQ(state.history.front(), 2u);

  // 1 was evicted, so it reads as new
  EXPECT_FALSE(detectTermination(state, single(1)));
  EXPECT_EQ(state.history.size(), 10u);

  // 3 is now the oldest entry, ten back
  EXPECT_TRUE(detectTermination(state, single(3)));
  EXPECT_EQ(state.endKind, PERIODIC);
  EXPECT_EQ(state.period, 10);
}

TEST(TerminationTest, EndedStateIsSticky) {
  EngineState state;
  detectTermination(state, std::vector<GLubyte>(16, CELL_DEAD));
  ASSERT_TRUE(state.hasEnded);

  EXPECT_TRUE(detectTermination(state, single(9)));
  EXPECT_EQ(state.endKind, EXTINCTION);
  EXPECT_EQ(state.aliveCount, 0);
  EXPECT_TRUE(state.history.empty());
}

TEST(TerminationTest, ReseedClearsRun) {
  EngineState state;
  state.generation = 12;
  detectTermination(state, single(2));
  detectTermination(state, single(2));
  ASSERT_TRUE(state.hasEnded);

  reseedState(state, single(5));
  EXPECT_EQ(state.generation, 0);
  EXPECT_EQ(state.aliveCount, 1);
  EXPECT_FALSE(state.hasEnded);
  EXPECT_EQ(state.endReason, "");
  EXPECT_TRUE(state.history.empty());
}
