#include <gtest/gtest.h>

#include "./src/sim/KERNEL.h"

class KernelTest : public ::testing::Test {
 protected:
  static constexpr int W = 8;
  static constexpr int H = 6;

  void SetUp() override { grid.assign(W * H, CELL_DEAD); }

  void set(int x, int y) { grid[y * W + x] = CELL_ALIVE; }

  std::vector<GLubyte> grid;
};

TEST_F(KernelTest, WrapHandlesNegativeAndOverflow) {
  EXPECT_EQ(wrap(-1, W), W - 1);
  EXPECT_EQ(wrap(W, W), 0);
  EXPECT_EQ(wrap(3, W), 3);
  EXPECT_EQ(wrap(-W - 2, W), W - 2);
}

TEST_F(KernelTest, CornerSeesNeighborsAcrossBothEdges) {
  // the three cells touching (0,0) through the wrap
  set(W - 1, H - 1);
  set(0, H - 1);
  set(W - 1, 0);

  EXPECT_EQ(countNeighbors(grid.data(), W, H, 0, 0), 3);
  EXPECT_EQ(nextCellState(grid.data(), W, H, 0, 0), CELL_ALIVE);
}

TEST_F(KernelTest, SurvivalAndBirthRule) {
  // live cell with 2 neighbors survives
  set(3, 3); set(2, 3); set(4, 3);
  EXPECT_EQ(nextCellState(grid.data(), W, H, 3, 3), CELL_ALIVE);

  // dead cell away from the row stays dead
  EXPECT_EQ(nextCellState(grid.data(), W, H, 3, 1), CELL_DEAD);

  // dead cells above and below the row have 3 neighbors
  EXPECT_EQ(nextCellState(grid.data(), W, H, 3, 2), CELL_ALIVE);
  EXPECT_EQ(nextCellState(grid.data(), W, H, 3, 4), CELL_ALIVE);

  // row ends have a single neighbor
  EXPECT_EQ(nextCellState(grid.data(), W, H, 2, 3), CELL_DEAD);
}

TEST_F(KernelTest, OvercrowdedCellDies) {
  set(3, 3);
  set(2, 2); set(3, 2); set(4, 2); set(2, 3);
  EXPECT_EQ(countNeighbors(grid.data(), W, H, 3, 3), 4);
  EXPECT_EQ(nextCellState(grid.data(), W, H, 3, 3), CELL_DEAD);
}

TEST_F(KernelTest, IntermediateBytesUseThreshold) {
  // 128 reads as dead, 129 as alive
  grid[1 * W + 1] = 128;
  grid[1 * W + 2] = 129;
  grid[1 * W + 3] = 200;
  grid[2 * W + 2] = 255;
  EXPECT_EQ(countNeighbors(grid.data(), W, H, 2, 2), 2);
}

TEST_F(KernelTest, PassReadsOnlyTheReadGrid) {
  set(2, 3); set(3, 3); set(4, 3);
  const std::vector<GLubyte> before = grid;

  std::vector<GLubyte> out(W * H, 7);
  cpuPass(grid.data(), out.data(), W, H);

  EXPECT_EQ(grid, before);
  for (int y = 0; y < H; y++) {
    for (int x = 0; x < W; x++) {
      const bool alive = (x == 3 && y >= 2 && y <= 4);
      EXPECT_EQ(out[y * W + x], alive ? CELL_ALIVE : CELL_DEAD) << "at (" << x << "," << y << ")";
    }
  }
}

TEST_F(KernelTest, PassIsDeterministic) {
  set(1, 0); set(2, 1); set(0, 2); set(1, 2); set(2, 2); set(6, 5);

  std::vector<GLubyte> a(W * H), b(W * H);
  cpuPass(grid.data(), a.data(), W, H);
  cpuPass(grid.data(), b.data(), W, H);
  EXPECT_EQ(a, b);
}
