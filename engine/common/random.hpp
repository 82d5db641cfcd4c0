#pragma once

#include <cstdint>
#include <random>

namespace gridduel {

using Rng = std::mt19937_64;

// seed == 0 draws from system entropy.
inline Rng make_rng(uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        seed = (uint64_t(rd()) << 32) ^ uint64_t(rd());
    }
    return Rng(seed);
}

inline int rand_below(Rng& rng, int n) {
    std::uniform_int_distribution<int> dist(0, n - 1);
    return dist(rng);
}

inline double rand_unit(Rng& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng);
}

} // namespace gridduel
