#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

// Seedable random stream. Every non-deterministic choice in the director
// (template pick, filler line, skill roll) draws from one of these so a
// session can be replayed from its seed.
class RandomSource
{
public:
    explicit RandomSource(uint64_t seed = 0x5eed);

    // Uniform in [0, 1).
    double NextUnit();
    // Uniform in [lo, hi], inclusive.
    int32_t NextInt(int32_t lo, int32_t hi);
    // Uniform index in [0, size). Returns 0 for an empty range.
    size_t PickIndex(size_t size);

    void Reseed(uint64_t seed);
    uint64_t Seed() const { return seed_; }

    // Stable per-session seed derived from a base seed and the session id.
    static uint64_t DeriveSeed(uint64_t baseSeed, std::string const& key);

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};
