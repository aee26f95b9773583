#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <stdexcept>

namespace nodal {

// ---------------------------------------------------------------------------
// WeightInit: source of initial edge weights for connect() calls that do
// not pass an explicit weight. Each call returns the next weight.
// ---------------------------------------------------------------------------
using WeightInit = std::function<double()>;

static constexpr uint64_t kDefaultWeightSeed = 0x6e6f64616cULL;

// Uniform(lo, hi) weights from a seeded mt19937_64. Two generators built with
// the same seed produce the same weight sequence.
inline WeightInit uniform_weight_init(uint64_t seed, double lo = -1.0, double hi = 1.0) {
    if (!(lo <= hi))
        throw std::invalid_argument("uniform_weight_init: lo must be <= hi");
    auto rng  = std::make_shared<std::mt19937_64>(seed);
    auto dist = std::make_shared<std::uniform_real_distribution<double>>(lo, hi);
    return [rng, dist]() { return (*dist)(*rng); };
}

inline WeightInit constant_weight_init(double w) {
    return [w]() { return w; };
}

} // namespace nodal
