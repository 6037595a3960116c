#pragma once

#include <cstdint>
#include <random>

/**
 * RandomSource - Byte generator for CXNN
 *
 * One uniformly distributed byte per call. Tests substitute a mock.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    virtual uint8_t NextByte() = 0;
};

class MersenneRandom : public RandomSource {
public:
    MersenneRandom() : engine(std::random_device{}()), distribution(0, 255) {}
    explicit MersenneRandom(uint32_t seed) : engine(seed), distribution(0, 255) {}

    uint8_t NextByte() override { return static_cast<uint8_t>(distribution(engine)); }

private:
    std::mt19937 engine;
    std::uniform_int_distribution<int> distribution;
};
