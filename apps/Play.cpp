#include "KnisterGame.hpp"
#include "GameUtils.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

// Ask until the player names a free cell. Returns -1 on end of input.
static int askAction(const KnisterGame& game) {
    while (true) {
        std::cout << "Choose a cell (index 0-24 or 'r,c' with row and column 1-5): " << std::flush;

        std::string input;
        if (!std::getline(std::cin, input)) {
            return -1;
        }

        int action = -1;
        bool pair = input.find(',') != std::string::npos;
        ParseStatus status = GameUtils::parseAction(input, action);
        if (status == ParseStatus::MALFORMED) {
            if (pair) {
                std::cout << "Invalid format, use 'r,c' (example: 2,3)." << std::endl;
            } else {
                std::cout << "Invalid input, enter a number or 'r,c'." << std::endl;
            }
            continue;
        }
        if (status == ParseStatus::OUT_OF_RANGE) {
            if (pair) {
                std::cout << "Row and column must be between 1 and 5." << std::endl;
            } else {
                std::cout << "Index must be between 0 and 24." << std::endl;
            }
            continue;
        }

        if (!game.isLegalAction(action)) {
            std::cout << "Cell " << GameUtils::displayAction(action) << " is already taken, try again." << std::endl;
            continue;
        }

        return action;
    }
}

// How to run: ./knister_play [seed]
int main(int argc, char* argv[]) {
    KnisterGame::Config config = KnisterGame::Config::standard();

    if (argc >= 2) {
        try {
            config = KnisterGame::Config::seeded(std::stoull(argv[1]));
        } catch (const std::invalid_argument&) {
            std::cerr << "Invalid seed: " << argv[1] << std::endl;
            return 1;
        } catch (const std::out_of_range&) {
            std::cerr << "Seed out of range: " << argv[1] << std::endl;
            return 1;
        }
    }

    KnisterGame game(config);
    game.newGame();

    std::cout << "Welcome to Knister!" << std::endl;
    std::cout << "Fill the 5x5 grid by placing each dice total in a free cell.\n" << std::endl;

    while (!game.hasFinished()) {
        GameUtils::printGameState(game);

        int action = askAction(game);
        if (action < 0) {
            std::cout << "\nInput closed, leaving the game." << std::endl;
            return 0;
        }

        KnisterGame::PlacementResult result = game.chooseAction(action);
        if (!result.ok()) {
            std::cout << "Move rejected: " << actionStatusName(result.status) << std::endl;
            continue;
        }
        std::cout << "Placed " << result.placedValue << " at " << GameUtils::displayAction(action)
                  << " (+" << result.reward << ")" << std::endl;
    }

    std::cout << "\nGame over!" << std::endl;
    GameUtils::printGrid(game.getGrid());
    GameUtils::printScoreBreakdown(game.getScoreBreakdown());
    std::cout << "Final score: " << game.getTotalReward() << std::endl;

    return 0;
}
