#ifndef DICEROLLER_HPP
#define DICEROLLER_HPP

#include <cstdint>
#include <random>
#include <vector>

// Abstract source of six-sided die faces
class DiceRoller {
public:
    static constexpr int FACES = 6;

    virtual ~DiceRoller() = default;

    // Returns one face in [1, 6]
    virtual int rollDie() = 0;

    // Sum of two independent dice, in [2, 12]. Not uniform: 7 is the most
    // likely total, 2 and 12 the least.
    int rollPair() {
        int first = rollDie();
        int second = rollDie();
        return first + second;
    }
};

// Uniform dice backed by a 64-bit Mersenne Twister
class RandomDiceRoller : public DiceRoller {
public:
    RandomDiceRoller();  // seeded from std::random_device
    explicit RandomDiceRoller(uint64_t seed);
    ~RandomDiceRoller() override = default;

    int rollDie() override;
    void reseed(uint64_t seed);

private:
    std::mt19937_64 rng_;
    std::uniform_int_distribution<int> dist_;
};

// Replays a fixed list of faces, wrapping around at the end
class ScriptedDiceRoller : public DiceRoller {
public:
    ScriptedDiceRoller() = default;
    explicit ScriptedDiceRoller(std::vector<int> faces);
    ~ScriptedDiceRoller() override = default;

    int rollDie() override;

    void setFaces(std::vector<int> faces);
    // Restart the script and the roll count
    void rewind() {
        next_ = 0;
        rollCount_ = 0;
    }
    int getRollCount() const { return rollCount_; }

private:
    std::vector<int> faces_;
    size_t next_ = 0;
    int rollCount_ = 0;
};

#endif // DICEROLLER_HPP
