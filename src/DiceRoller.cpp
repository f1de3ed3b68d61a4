#include "DiceRoller.hpp"
#include <utility>

// ============================================================================
// RandomDiceRoller
// ============================================================================

RandomDiceRoller::RandomDiceRoller()
    : rng_(std::random_device{}()), dist_(1, FACES) {}

RandomDiceRoller::RandomDiceRoller(uint64_t seed)
    : rng_(seed), dist_(1, FACES) {}

int RandomDiceRoller::rollDie() {
    return dist_(rng_);
}

void RandomDiceRoller::reseed(uint64_t seed) {
    rng_.seed(seed);
    dist_.reset();
}

// ============================================================================
// ScriptedDiceRoller
// ============================================================================

ScriptedDiceRoller::ScriptedDiceRoller(std::vector<int> faces)
    : faces_(std::move(faces)) {}

int ScriptedDiceRoller::rollDie() {
    rollCount_++;
    if (faces_.empty()) {
        return 1;
    }
    int face = faces_[next_];
    next_ = (next_ + 1) % faces_.size();
    return face;
}

void ScriptedDiceRoller::setFaces(std::vector<int> faces) {
    faces_ = std::move(faces);
    next_ = 0;
}
