#include "GameUtils.hpp"
#include "Grid.hpp"
#include "KnisterGame.hpp"
#include "Scorer.hpp"
#include <cctype>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) begin++;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
    return s.substr(begin, end - begin);
}

// Optionally signed integer. Values too long to be a cell come back as
// +/-10000, so they stay well formed but out of range.
std::optional<int> parseNumber(const std::string& text) {
    std::string s = trim(text);
    bool negative = !s.empty() && s[0] == '-';
    std::string digits = negative ? s.substr(1) : s;
    if (digits.empty()) {
        return std::nullopt;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    int value = digits.size() > 4 ? 10000 : std::stoi(digits);
    return negative ? -value : value;
}

const char* const BORDER = "  +---+---+---+---+---+\n";

} // namespace

ParseStatus GameUtils::parseAction(const std::string& text, int& action) {
    size_t comma = text.find(',');

    if (comma != std::string::npos) {
        // Row, column format
        std::optional<int> row = parseNumber(text.substr(0, comma));
        std::optional<int> col = parseNumber(text.substr(comma + 1));
        if (!row || !col) {
            return ParseStatus::MALFORMED;
        }
        if (!Grid::inBounds(*row - 1, *col - 1)) {
            return ParseStatus::OUT_OF_RANGE;
        }
        action = Grid::toIndex(*row - 1, *col - 1);
        return ParseStatus::OK;
    }

    // Single index format
    std::optional<int> index = parseNumber(text);
    if (!index) {
        return ParseStatus::MALFORMED;
    }
    if (!Grid::isValidIndex(*index)) {
        return ParseStatus::OUT_OF_RANGE;
    }
    action = *index;
    return ParseStatus::OK;
}

int GameUtils::parseAction(const std::string& text) {
    int action = -1;
    return parseAction(text, action) == ParseStatus::OK ? action : -1;
}

std::string GameUtils::displayAction(int action) {
    if (!Grid::isValidIndex(action)) {
        return "?";
    }
    return std::to_string(Grid::toRow(action) + 1) + "," + std::to_string(Grid::toCol(action) + 1);
}

std::string GameUtils::formatGrid(const Grid& grid) {
    std::ostringstream out;
    out << "    1   2   3   4   5\n";
    out << BORDER;
    for (int row = 0; row < Grid::SIZE; row++) {
        out << (row + 1) << " |";
        for (int col = 0; col < Grid::SIZE; col++) {
            int value = grid.getCell(row, col);
            if (value != 0) {
                out << std::setw(2) << value;
            } else {
                out << "  ";
            }
            out << " |";
        }
        out << "\n" << BORDER;
    }
    return out.str();
}

void GameUtils::printGrid(const Grid& grid) {
    std::cout << "\n" << formatGrid(grid) << "\n";
}

void GameUtils::printGameState(const KnisterGame& game) {
    printGrid(game.getGrid());

    std::optional<int> roll = game.getCurrentRoll();
    std::cout << "Current roll: ";
    if (roll) {
        std::cout << *roll;
    } else {
        std::cout << "-";
    }
    std::cout << "\n";
    std::cout << "Free cells: " << game.getAvailableActions().size() << "\n";
    std::cout << "Last move reward: " << game.getLastReward() << "\n";
    std::cout << "Total score: " << game.getTotalReward() << "\n";
}

void GameUtils::printScoreBreakdown(const ScoreBreakdown& breakdown) {
    std::cout << "Rows:     ";
    for (int score : breakdown.rows) {
        std::cout << std::setw(3) << score;
    }
    std::cout << "\nColumns:  ";
    for (int score : breakdown.columns) {
        std::cout << std::setw(3) << score;
    }
    std::cout << "\nDiagonals: " << breakdown.mainDiagonal << " and " << breakdown.antiDiagonal
              << " (x" << breakdown.diagonalMultiplier << ")\n";
    std::cout << "Total: " << breakdown.total << "\n";
}
