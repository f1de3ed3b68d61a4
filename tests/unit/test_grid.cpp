#include <gtest/gtest.h>
#include "Grid.hpp"

class GridTest : public ::testing::Test {
protected:
    Grid grid;
};

TEST_F(GridTest, EmptyGridTest) {
    // Test that a new grid is empty
    for (int row = 0; row < Grid::SIZE; ++row) {
        for (int col = 0; col < Grid::SIZE; ++col) {
            EXPECT_TRUE(grid.isEmpty(row, col));
            EXPECT_EQ(grid.getCell(row, col), 0);
        }
    }
    EXPECT_EQ(grid.filledCount(), 0);
    EXPECT_FALSE(grid.isFull());
}

TEST_F(GridTest, SetAndGetCell) {
    grid.setCell(2, 3, 7);
    EXPECT_EQ(grid.getCell(2, 3), 7);
    EXPECT_FALSE(grid.isEmpty(2, 3));
    EXPECT_EQ(grid.filledCount(), 1);

    // Verify other positions remain empty
    EXPECT_TRUE(grid.isEmpty(0, 0));
    EXPECT_TRUE(grid.isEmpty(4, 4));
}

TEST_F(GridTest, OutOfBoundsIsIgnored) {
    grid.setCell(-1, 0, 5);
    grid.setCell(0, 5, 5);
    grid.setCell(5, 5, 5);

    EXPECT_EQ(grid.filledCount(), 0);
    EXPECT_EQ(grid.getCell(-1, 0), 0);
    EXPECT_EQ(grid.getCell(0, 5), 0);
    EXPECT_TRUE(grid.isEmpty(7, 7));
}

TEST_F(GridTest, ClearGrid) {
    grid.setCell(0, 0, 2);
    grid.setCell(4, 4, 12);
    grid.setCell(2, 2, 7);

    grid.clear();

    EXPECT_EQ(grid.filledCount(), 0);
    EXPECT_TRUE(grid.isEmpty(2, 2));
}

TEST_F(GridTest, FullGrid) {
    for (int i = 0; i < Grid::NUM_CELLS; ++i) {
        grid.setCell(Grid::toRow(i), Grid::toCol(i), 2 + i % 11);
    }
    EXPECT_EQ(grid.filledCount(), Grid::NUM_CELLS);
    EXPECT_TRUE(grid.isFull());
}

TEST_F(GridTest, IndexConversion) {
    EXPECT_EQ(Grid::toIndex(0, 0), 0);
    EXPECT_EQ(Grid::toIndex(1, 0), 5);
    EXPECT_EQ(Grid::toIndex(4, 4), 24);
    EXPECT_EQ(Grid::toRow(13), 2);
    EXPECT_EQ(Grid::toCol(13), 3);

    EXPECT_TRUE(Grid::isValidIndex(0));
    EXPECT_TRUE(Grid::isValidIndex(24));
    EXPECT_FALSE(Grid::isValidIndex(-1));
    EXPECT_FALSE(Grid::isValidIndex(25));
}

TEST_F(GridTest, RowsAndColumns) {
    // value = 10 * row + col makes every cell unique
    for (int row = 0; row < Grid::SIZE; ++row) {
        for (int col = 0; col < Grid::SIZE; ++col) {
            grid.setCell(row, col, 10 * row + col + 1);
        }
    }

    Grid::Line row2 = grid.getRow(2);
    EXPECT_EQ(row2, (Grid::Line{21, 22, 23, 24, 25}));

    Grid::Line col3 = grid.getColumn(3);
    EXPECT_EQ(col3, (Grid::Line{4, 14, 24, 34, 44}));
}

TEST_F(GridTest, Diagonals) {
    for (int row = 0; row < Grid::SIZE; ++row) {
        for (int col = 0; col < Grid::SIZE; ++col) {
            grid.setCell(row, col, 10 * row + col + 1);
        }
    }

    EXPECT_EQ(grid.getMainDiagonal(), (Grid::Line{1, 12, 23, 34, 45}));
    // (0,4) (1,3) (2,2) (3,1) (4,0)
    EXPECT_EQ(grid.getAntiDiagonal(), (Grid::Line{5, 14, 23, 32, 41}));
}

TEST_F(GridTest, CopiesAreIndependent) {
    grid.setCell(1, 1, 6);
    Grid copy = grid;
    EXPECT_EQ(copy, grid);

    copy.setCell(1, 1, 9);
    EXPECT_NE(copy, grid);
    EXPECT_EQ(grid.getCell(1, 1), 6);
}
