#ifndef GRID_HPP
#define GRID_HPP

#include <array>

class Grid {
public:
    static constexpr int SIZE = 5;
    static constexpr int NUM_CELLS = SIZE * SIZE;

    using Line = std::array<int, SIZE>;

    Grid();

    // Core operations
    void setCell(int row, int col, int value);
    int getCell(int row, int col) const;
    bool isEmpty(int row, int col) const;
    void clear();

    int filledCount() const;
    bool isFull() const { return filledCount() == NUM_CELLS; }

    // Lines
    Line getRow(int row) const;
    Line getColumn(int col) const;
    Line getMainDiagonal() const;
    Line getAntiDiagonal() const;  // (0,4) (1,3) (2,2) (3,1) (4,0)

    // Flat index <-> (row, col)
    static int toIndex(int row, int col) { return row * SIZE + col; }
    static int toRow(int index) { return index / SIZE; }
    static int toCol(int index) { return index % SIZE; }
    static bool isValidIndex(int index) { return index >= 0 && index < NUM_CELLS; }
    static bool inBounds(int row, int col) {
        return row >= 0 && row < SIZE && col >= 0 && col < SIZE;
    }

    bool operator==(const Grid& other) const { return cells == other.cells; }
    bool operator!=(const Grid& other) const { return !(*this == other); }

private:
    std::array<int, NUM_CELLS> cells;
};

#endif // GRID_HPP
