#ifndef GAMEUTILS_HPP
#define GAMEUTILS_HPP

#include <string>

// Forward declarations
class Grid;
class KnisterGame;
struct ScoreBreakdown;

enum class ParseStatus {
    OK,
    MALFORMED,     // not an integer, or not a single "r,c" pair
    OUT_OF_RANGE   // well formed, but names no cell of the grid
};

class GameUtils {
public:
    // Action parsing/display. Accepts "12" (flat index) or "3,3" (1-based row,col).
    // Occupancy is not checked. action is written only on OK.
    static ParseStatus parseAction(const std::string& text, int& action);
    // Same, returning -1 for malformed or out of range input
    static int parseAction(const std::string& text);
    static std::string displayAction(int action);

    // Grid printing
    static std::string formatGrid(const Grid& grid);
    static void printGrid(const Grid& grid);
    static void printGameState(const KnisterGame& game);
    static void printScoreBreakdown(const ScoreBreakdown& breakdown);
};

#endif // GAMEUTILS_HPP
