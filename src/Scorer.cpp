#include "Scorer.hpp"
#include <algorithm>
#include <functional>
#include <map>
#include <vector>

// ============================================================================
// Line classification
// ============================================================================

LineCategory Scorer::classifyLine(const Grid::Line& line) {
    std::vector<int> values;
    values.reserve(line.size());
    for (int v : line) {
        if (v != 0) values.push_back(v);
    }

    if (values.size() < 2) {
        return LineCategory::NONE;
    }

    std::map<int, int> counts;
    for (int v : values) counts[v]++;

    std::vector<int> countsSorted;
    countsSorted.reserve(counts.size());
    for (const auto& entry : counts) {
        countsSorted.push_back(entry.second);
    }
    std::sort(countsSorted.begin(), countsSorted.end(), std::greater<int>());

    using Counts = std::vector<int>;
    if (countsSorted == Counts{5}) {
        return LineCategory::FIVE_OF_A_KIND;
    }
    if (countsSorted == Counts{4} || countsSorted == Counts{4, 1}) {
        return LineCategory::FOUR_OF_A_KIND;
    }
    if (countsSorted == Counts{3, 2}) {
        return LineCategory::FULL_HOUSE;
    }
    if (countsSorted == Counts{2, 2} || countsSorted == Counts{2, 2, 1}) {
        return LineCategory::TWO_PAIRS;
    }
    if (countsSorted[0] == 3) {
        return LineCategory::THREE_OF_A_KIND;
    }
    if (countsSorted[0] == 2) {
        return LineCategory::ONE_PAIR;
    }

    // All values distinct from here on
    if (values.size() == static_cast<size_t>(Grid::SIZE)) {
        std::sort(values.begin(), values.end());
        bool consecutive = true;
        for (size_t i = 0; i + 1 < values.size(); i++) {
            if (static_cast<long long>(values[i + 1]) - values[i] != 1) {
                consecutive = false;
                break;
            }
        }
        if (consecutive) {
            bool hasSeven = std::find(values.begin(), values.end(), 7) != values.end();
            return hasSeven ? LineCategory::STRAIGHT_WITH_SEVEN : LineCategory::STRAIGHT_NO_SEVEN;
        }
    }

    return LineCategory::NONE;
}

int Scorer::categoryPoints(LineCategory category) {
    switch (category) {
        case LineCategory::FIVE_OF_A_KIND:      return FIVE_OF_A_KIND;
        case LineCategory::FOUR_OF_A_KIND:      return FOUR_OF_A_KIND;
        case LineCategory::FULL_HOUSE:          return FULL_HOUSE;
        case LineCategory::TWO_PAIRS:           return TWO_PAIRS;
        case LineCategory::THREE_OF_A_KIND:     return THREE_OF_A_KIND;
        case LineCategory::ONE_PAIR:            return ONE_PAIR;
        case LineCategory::STRAIGHT_WITH_SEVEN: return STRAIGHT_WITH_SEVEN;
        case LineCategory::STRAIGHT_NO_SEVEN:   return STRAIGHT_NO_SEVEN;
        case LineCategory::NONE:                break;
    }
    return 0;
}

const char* Scorer::categoryName(LineCategory category) {
    switch (category) {
        case LineCategory::FIVE_OF_A_KIND:      return "Five of a kind";
        case LineCategory::FOUR_OF_A_KIND:      return "Four of a kind";
        case LineCategory::FULL_HOUSE:          return "Full house";
        case LineCategory::TWO_PAIRS:           return "Two pairs";
        case LineCategory::THREE_OF_A_KIND:     return "Three of a kind";
        case LineCategory::ONE_PAIR:            return "One pair";
        case LineCategory::STRAIGHT_WITH_SEVEN: return "Straight (with 7)";
        case LineCategory::STRAIGHT_NO_SEVEN:   return "Straight (no 7)";
        case LineCategory::NONE:                break;
    }
    return "None";
}

int Scorer::scoreLine(const Grid::Line& line) {
    return categoryPoints(classifyLine(line));
}

// ============================================================================
// Grid totals
// ============================================================================

int Scorer::calculateScore(const Grid& grid, int diagonalMultiplier) {
    int score = 0;

    for (int i = 0; i < Grid::SIZE; i++) {
        score += scoreLine(grid.getRow(i));
        score += scoreLine(grid.getColumn(i));
    }

    score += scoreLine(grid.getMainDiagonal()) * diagonalMultiplier;
    score += scoreLine(grid.getAntiDiagonal()) * diagonalMultiplier;

    return score;
}

ScoreBreakdown Scorer::breakdown(const Grid& grid, int diagonalMultiplier) {
    ScoreBreakdown result;
    result.diagonalMultiplier = diagonalMultiplier;

    for (int i = 0; i < Grid::SIZE; i++) {
        result.rows[i] = scoreLine(grid.getRow(i));
        result.columns[i] = scoreLine(grid.getColumn(i));
        result.total += result.rows[i] + result.columns[i];
    }

    result.mainDiagonal = scoreLine(grid.getMainDiagonal());
    result.antiDiagonal = scoreLine(grid.getAntiDiagonal());
    result.total += (result.mainDiagonal + result.antiDiagonal) * diagonalMultiplier;

    return result;
}
