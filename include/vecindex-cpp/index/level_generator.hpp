#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <random>
#include <utility>

namespace vecindex_cpp::index {

/// Assigns each inserted node its top layer with exponentially decaying probability
/// P(level >= l + 1) / P(level >= l) = exp(-1 / ml_factor); with ml_factor = 1/ln(2)
/// each layer holds about half the nodes of the one below it.
template <typename URBG = std::mt19937> class LevelGenerator {
public:
    using result_type = std::size_t;

    LevelGenerator(float ml_factor, std::size_t max_level, URBG rng)
        : ml_factor_(ml_factor), max_level_(max_level), rng_(std::move(rng)) {}

    /// Draw a level for a new node
    result_type operator()() {
        // [0, 1) -> (0, 1] so log() never sees zero
        const double u = 1.0 - dist_(rng_);
        return level_for(u);
    }

    /// Deterministic mapping from a uniform draw u in (0, 1] to a level
    [[nodiscard]] result_type level_for(double u) const {
        if (!(u > 0.0))
            return max_level_;
        const double raw = std::floor(-std::log(u) * static_cast<double>(ml_factor_));
        if (raw >= static_cast<double>(max_level_))
            return max_level_;
        return static_cast<result_type>(std::max(raw, 0.0));
    }

    [[nodiscard]] float ml_factor() const noexcept { return ml_factor_; }
    [[nodiscard]] std::size_t max_level() const noexcept { return max_level_; }

private:
    float ml_factor_;
    std::size_t max_level_;
    URBG rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

} // namespace vecindex_cpp::index
