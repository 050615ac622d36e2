#include "discrete_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

DiscreteSampler::DiscreteSampler(const std::vector<double>& weights)
{
    if (weights.empty()) {
        throw std::invalid_argument("Sampler needs at least one weight");
    }

    double total = 0.0;
    for (double w : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            throw std::invalid_argument("Sampler weights must be finite and >= 0");
        }
        total += w;
    }
    if (total <= 0.0) {
        throw std::invalid_argument("Sampler weights must not all be zero");
    }

    cumulative_.reserve(weights.size());
    double running = 0.0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        running += weights[i] / total;
        cumulative_.push_back(running);
        if (weights[i] > 0.0) {
            last_positive_ = i;
        }
    }
    // Rounding can leave the tail a hair under 1.0.
    std::fill(cumulative_.begin() + static_cast<std::ptrdiff_t>(last_positive_), cumulative_.end(), 1.0);
}

std::size_t DiscreteSampler::Sample(std::mt19937& gen) const
{
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return Pick(dist(gen));
}

std::size_t DiscreteSampler::Pick(double u) const
{
    auto it = std::upper_bound(cumulative_.begin(), cumulative_.end(), u);
    if (it == cumulative_.end()) {
        return last_positive_;
    }
    return static_cast<std::size_t>(it - cumulative_.begin());
}

std::vector<double> DiscreteSampler::Probabilities() const
{
    std::vector<double> probs;
    probs.reserve(cumulative_.size());
    double previous = 0.0;
    for (double c : cumulative_) {
        probs.push_back(c - previous);
        previous = c;
    }
    return probs;
}
