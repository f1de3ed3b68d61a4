#ifndef KNISTERGAME_HPP
#define KNISTERGAME_HPP

#include "DiceRoller.hpp"
#include "Grid.hpp"
#include "Scorer.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

class KnisterGame {
public:
    static constexpr int GRID_SIZE = Grid::SIZE;
    static constexpr int NUM_CELLS = Grid::NUM_CELLS;

    enum class ActionStatus {
        OK,
        GAME_FINISHED,   // placement attempted after the last cell was filled
        INVALID_ACTION,  // cell occupied or index outside [0, 24]
        NO_DICE          // no pending roll
    };

    // Outcome of chooseAction. On failure only status and action are set.
    struct PlacementResult {
        ActionStatus status = ActionStatus::OK;
        int action = -1;
        int placedValue = 0;
        int reward = 0;
        int totalScore = 0;
        bool finished = false;

        bool ok() const { return status == ActionStatus::OK; }
    };

    struct Config {
        DiceRoller* diceRoller = nullptr;  // not owned; nullptr -> internal RandomDiceRoller
        bool useSeed = false;              // seed the internal roller with `seed`
        uint64_t seed = 0;
        int diagonalMultiplier = Scorer::DIAGONAL_MULTIPLIER;

        static Config standard() { return Config(); }

        static Config seeded(uint64_t seed) {
            Config c;
            c.useSeed = true;
            c.seed = seed;
            return c;
        }

        static Config withRoller(DiceRoller* roller) {
            Config c;
            c.diceRoller = roller;
            return c;
        }
    };

private:
    Config config_;
    std::unique_ptr<DiceRoller> ownedRoller_;
    DiceRoller* roller_;

    Grid grid_;
    std::vector<int> availablePositions_;
    std::optional<int> currentRoll_;
    bool finished_;
    int lastReward_;
    int previousTotal_;
    int moveCount_;

    void resetState();

public:
    explicit KnisterGame(const Config& config = Config::standard());

    // May own its dice roller
    KnisterGame(const KnisterGame&) = delete;
    KnisterGame& operator=(const KnisterGame&) = delete;

    // Core game functions
    void newGame();
    void rollDice();
    void setCurrentRoll(int value);  // not range checked
    PlacementResult chooseAction(int action);

    // Game state queries
    std::optional<int> getCurrentRoll() const { return currentRoll_; }
    Grid getGrid() const { return grid_; }
    std::vector<int> getAvailableActions() const { return availablePositions_; }
    bool isLegalAction(int action) const;
    bool hasFinished() const { return finished_; }
    int getMoveCount() const { return moveCount_; }

    // Rewards
    int getLastReward() const { return lastReward_; }
    int getTotalReward() const;
    ScoreBreakdown getScoreBreakdown() const;

    const Config& getConfig() const { return config_; }

    // Debug
    void print() const;
};

const char* actionStatusName(KnisterGame::ActionStatus status);

#endif // KNISTERGAME_HPP
