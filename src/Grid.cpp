#include "Grid.hpp"
#include <algorithm>

Grid::Grid() {
    cells.fill(0);
}

void Grid::setCell(int row, int col, int value) {
    // Check bounds
    if (!inBounds(row, col)) {
        return;
    }
    cells[toIndex(row, col)] = value;
}

int Grid::getCell(int row, int col) const {
    // Out of bounds reads as empty
    if (!inBounds(row, col)) {
        return 0;
    }
    return cells[toIndex(row, col)];
}

bool Grid::isEmpty(int row, int col) const {
    return getCell(row, col) == 0;
}

void Grid::clear() {
    cells.fill(0);
}

int Grid::filledCount() const {
    return static_cast<int>(std::count_if(cells.begin(), cells.end(),
                                          [](int v) { return v != 0; }));
}

Grid::Line Grid::getRow(int row) const {
    Line line{};
    for (int col = 0; col < SIZE; col++) {
        line[col] = getCell(row, col);
    }
    return line;
}

Grid::Line Grid::getColumn(int col) const {
    Line line{};
    for (int row = 0; row < SIZE; row++) {
        line[row] = getCell(row, col);
    }
    return line;
}

Grid::Line Grid::getMainDiagonal() const {
    Line line{};
    for (int i = 0; i < SIZE; i++) {
        line[i] = getCell(i, i);
    }
    return line;
}

Grid::Line Grid::getAntiDiagonal() const {
    Line line{};
    for (int i = 0; i < SIZE; i++) {
        line[i] = getCell(i, SIZE - 1 - i);
    }
    return line;
}
