#ifndef SCORER_HPP
#define SCORER_HPP

#include "Grid.hpp"
#include <array>

// Knister line patterns. Order has no meaning for scoring, see classifyLine.
enum class LineCategory {
    NONE,
    ONE_PAIR,
    TWO_PAIRS,
    THREE_OF_A_KIND,
    FULL_HOUSE,
    FOUR_OF_A_KIND,
    FIVE_OF_A_KIND,
    STRAIGHT_WITH_SEVEN,
    STRAIGHT_NO_SEVEN
};

struct ScoreBreakdown;

class Scorer {
public:
    // Points per pattern
    static constexpr int FIVE_OF_A_KIND = 10;
    static constexpr int FOUR_OF_A_KIND = 6;
    static constexpr int FULL_HOUSE = 8;
    static constexpr int THREE_OF_A_KIND = 3;
    static constexpr int TWO_PAIRS = 3;
    static constexpr int ONE_PAIR = 1;
    static constexpr int STRAIGHT_WITH_SEVEN = 8;
    static constexpr int STRAIGHT_NO_SEVEN = 12;
    static constexpr int DIAGONAL_MULTIPLIER = 2;

    // Empty cells (0) are ignored. A straight needs all five cells filled.
    static LineCategory classifyLine(const Grid::Line& line);
    static int categoryPoints(LineCategory category);
    static const char* categoryName(LineCategory category);

    static int scoreLine(const Grid::Line& line);

    // Rows + columns + both diagonals, diagonals weighted by diagonalMultiplier
    static int calculateScore(const Grid& grid, int diagonalMultiplier = DIAGONAL_MULTIPLIER);
    static ScoreBreakdown breakdown(const Grid& grid, int diagonalMultiplier = DIAGONAL_MULTIPLIER);
};

// Unweighted score of every scored line plus the weighted grid total
struct ScoreBreakdown {
    std::array<int, Grid::SIZE> rows{};
    std::array<int, Grid::SIZE> columns{};
    int mainDiagonal = 0;
    int antiDiagonal = 0;
    int diagonalMultiplier = Scorer::DIAGONAL_MULTIPLIER;
    int total = 0;
};

#endif // SCORER_HPP
