#include "Util/RandomSource.h"

RandomSource::RandomSource(uint64_t seed)
    : seed_(seed), engine_(seed)
{
}

double RandomSource::NextUnit()
{
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(engine_);
}

int32_t RandomSource::NextInt(int32_t lo, int32_t hi)
{
    if (hi <= lo)
    {
        return lo;
    }
    std::uniform_int_distribution<int32_t> dist(lo, hi);
    return dist(engine_);
}

size_t RandomSource::PickIndex(size_t size)
{
    if (size <= 1)
    {
        return 0;
    }
    std::uniform_int_distribution<size_t> dist(0, size - 1);
    return dist(engine_);
}

void RandomSource::Reseed(uint64_t seed)
{
    seed_ = seed;
    engine_.seed(seed);
}

uint64_t RandomSource::DeriveSeed(uint64_t baseSeed, std::string const& key)
{
    // FNV-1a over the key, then a murmur-style finalizer mixed with the base seed.
    uint64_t x = 0xcbf29ce484222325ULL;
    for (unsigned char c : key)
    {
        x ^= c;
        x *= 0x100000001b3ULL;
    }
    x ^= baseSeed;
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    x ^= x >> 33;
    return x;
}
