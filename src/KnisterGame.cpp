#include "KnisterGame.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>

KnisterGame::KnisterGame(const Config& config) : config_(config), roller_(config.diceRoller) {
    if (!roller_) {
        if (config_.useSeed) {
            ownedRoller_ = std::make_unique<RandomDiceRoller>(config_.seed);
        } else {
            ownedRoller_ = std::make_unique<RandomDiceRoller>();
        }
        roller_ = ownedRoller_.get();
    }
    resetState();
}

void KnisterGame::resetState() {
    grid_.clear();
    availablePositions_.resize(NUM_CELLS);
    std::iota(availablePositions_.begin(), availablePositions_.end(), 0);
    currentRoll_.reset();
    finished_ = false;
    lastReward_ = 0;
    previousTotal_ = 0;
    moveCount_ = 0;
}

void KnisterGame::newGame() {
    resetState();
    rollDice();
}

void KnisterGame::rollDice() {
    currentRoll_ = roller_->rollPair();
}

void KnisterGame::setCurrentRoll(int value) {
    currentRoll_ = value;
}

bool KnisterGame::isLegalAction(int action) const {
    return std::find(availablePositions_.begin(), availablePositions_.end(), action)
           != availablePositions_.end();
}

KnisterGame::PlacementResult KnisterGame::chooseAction(int action) {
    PlacementResult result;
    result.action = action;

    if (finished_) {
        result.status = ActionStatus::GAME_FINISHED;
        return result;
    }

    auto it = std::find(availablePositions_.begin(), availablePositions_.end(), action);
    if (it == availablePositions_.end()) {
        result.status = ActionStatus::INVALID_ACTION;
        return result;
    }

    if (!currentRoll_) {
        result.status = ActionStatus::NO_DICE;
        return result;
    }

    // Place before scoring
    int value = *currentRoll_;
    grid_.setCell(Grid::toRow(action), Grid::toCol(action), value);
    availablePositions_.erase(it);
    moveCount_++;

    int scoreNow = Scorer::calculateScore(grid_, config_.diagonalMultiplier);
    lastReward_ = scoreNow - previousTotal_;
    previousTotal_ = scoreNow;

    // The finishing move keeps its roll; otherwise draw the next one
    if (availablePositions_.empty()) {
        finished_ = true;
    } else {
        rollDice();
    }

    result.placedValue = value;
    result.reward = lastReward_;
    result.totalScore = scoreNow;
    result.finished = finished_;
    return result;
}

int KnisterGame::getTotalReward() const {
    return Scorer::calculateScore(grid_, config_.diagonalMultiplier);
}

ScoreBreakdown KnisterGame::getScoreBreakdown() const {
    return Scorer::breakdown(grid_, config_.diagonalMultiplier);
}

void KnisterGame::print() const {
    std::cout << "    ";
    for (int col = 0; col < GRID_SIZE; col++) {
        std::cout << std::setw(3) << (col + 1);
    }
    std::cout << "\n";

    for (int row = 0; row < GRID_SIZE; row++) {
        std::cout << std::setw(3) << (row + 1) << " ";
        for (int col = 0; col < GRID_SIZE; col++) {
            int value = grid_.getCell(row, col);
            if (value == 0) {
                std::cout << "  ·";
            } else {
                std::cout << std::setw(3) << value;
            }
        }
        std::cout << "\n";
    }

    std::cout << "Roll: ";
    if (currentRoll_) {
        std::cout << *currentRoll_;
    } else {
        std::cout << "-";
    }
    std::cout << ", free cells: " << availablePositions_.size()
              << ", last reward: " << lastReward_
              << ", total: " << getTotalReward()
              << (finished_ ? " (finished)" : "") << "\n";
}

const char* actionStatusName(KnisterGame::ActionStatus status) {
    switch (status) {
        case KnisterGame::ActionStatus::OK:             return "OK";
        case KnisterGame::ActionStatus::GAME_FINISHED:  return "GameFinished";
        case KnisterGame::ActionStatus::INVALID_ACTION: return "InvalidAction";
        case KnisterGame::ActionStatus::NO_DICE:        return "NoDice";
    }
    return "Unknown";
}
