#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <random>

namespace sudoku_rounds {

inline uint64_t splitmix64(uint64_t& state) {
    uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30u)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27u)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31u);
}

// Per-session generator. Sessions built from the same seed make the same
// sequence of shuffles, hence the same puzzles.
class RandomSource {
public:
    RandomSource() : RandomSource(fresh_seed()) {}
    explicit RandomSource(uint64_t seed) { reseed(seed); }

    static uint64_t fresh_seed() {
        std::random_device rd;
        uint64_t state = (static_cast<uint64_t>(rd()) << 32U) ^ static_cast<uint64_t>(rd());
        state ^= static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
        return splitmix64(state);
    }

    void reseed(uint64_t seed) {
        seed_ = seed;
        rng_.seed(seed);
    }

    uint64_t seed() const { return seed_; }

    template <typename Container>
    void shuffle(Container& c) {
        std::shuffle(c.begin(), c.end(), rng_);
    }

    // Uniform in [0, bound).
    int below(int bound) {
        std::uniform_int_distribution<int> dist(0, bound - 1);
        return dist(rng_);
    }

private:
    uint64_t seed_ = 0;
    std::mt19937_64 rng_;
};

} // namespace sudoku_rounds
