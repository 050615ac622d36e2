#pragma once

#include <cstddef>
#include <random>
#include <vector>

/**
 * @brief Weighted index sampler over a fixed list of weights.
 *
 * The weights are normalized once into a cumulative table; each draw is a
 * single uniform number and a binary search. Entries keep their
 * registration order, so equal cumulative values resolve to the earliest
 * entry and zero-weight entries are never returned.
 */
class DiscreteSampler {
public:
    /**
     * @throws std::invalid_argument for an empty list, a negative or
     * non-finite weight, or weights that sum to zero.
     */
    explicit DiscreteSampler(const std::vector<double>& weights);

    std::size_t Sample(std::mt19937& gen) const;

    // Maps u in [0, 1) onto an index; Sample() is Pick(uniform(gen)).
    std::size_t Pick(double u) const;

    // Normalized probability per entry, in registration order.
    std::vector<double> Probabilities() const;

    std::size_t size() const { return cumulative_.size(); }

private:
    std::vector<double> cumulative_;
    std::size_t last_positive_ = 0;
};
