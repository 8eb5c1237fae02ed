#pragma once

#include "core/types.hpp"
#include <vector>

namespace ActivePref {
namespace Sampling {

struct WeightedSample {
    Core::WeightVector w;
    double weight = 1.0;   // Unnormalized
};

// Weighted sample approximation of the posterior over reward weights.
// Rebuilt after every new constraint, never patched in place.
class Belief {
public:
    Belief() = default;
    explicit Belief(std::vector<WeightedSample> samples);

    size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }
    size_t dimension() const;

    const std::vector<WeightedSample>& samples() const { return samples_; }
    const WeightedSample& operator[](size_t i) const { return samples_[i]; }

    // Weights scaled to sum to one
    std::vector<double> normalized_weights() const;

    // Weighted mean of the samples, re-normalized to unit length
    Core::WeightVector mean_direction() const;

    // Weighted variance of w . diff
    double projection_variance(const std::vector<double>& diff) const;

    // Weighted fraction of samples with w . diff > 0
    double agreement(const std::vector<double>& diff) const;

    bool operator==(const Belief& other) const;
    bool operator!=(const Belief& other) const { return !(*this == other); }

private:
    std::vector<WeightedSample> samples_;
};

} // namespace Sampling
} // namespace ActivePref
