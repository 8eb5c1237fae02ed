#include "sampling/belief.hpp"
#include <stdexcept>
#include <utility>

namespace ActivePref {
namespace Sampling {

Belief::Belief(std::vector<WeightedSample> samples) : samples_(std::move(samples)) {
    if (samples_.empty()) {
        return;
    }
    const size_t dim = samples_.front().w.size();
    for (const auto& sample : samples_) {
        if (sample.w.size() != dim) {
            throw Core::DimensionMismatchError("Belief samples have mixed dimensions",
                                               dim, sample.w.size());
        }
        if (sample.weight < 0.0) {
            throw std::invalid_argument("Belief sample weights must be non-negative");
        }
    }
}

size_t Belief::dimension() const {
    return samples_.empty() ? 0 : samples_.front().w.size();
}

std::vector<double> Belief::normalized_weights() const {
    std::vector<double> weights(samples_.size());
    double total = 0.0;
    for (size_t i = 0; i < samples_.size(); ++i) {
        weights[i] = samples_[i].weight;
        total += weights[i];
    }
    if (total <= 0.0) {
        throw std::runtime_error("Belief has zero total weight");
    }
    for (double& w : weights) {
        w /= total;
    }
    return weights;
}

Core::WeightVector Belief::mean_direction() const {
    if (samples_.empty()) {
        throw std::runtime_error("Mean direction of an empty belief");
    }
    auto weights = normalized_weights();
    Core::WeightVector mean(dimension(), 0.0);
    for (size_t i = 0; i < samples_.size(); ++i) {
        for (size_t d = 0; d < mean.size(); ++d) {
            mean[d] += weights[i] * samples_[i].w[d];
        }
    }
    return Core::normalized(mean);
}

double Belief::projection_variance(const std::vector<double>& diff) const {
    if (samples_.empty()) {
        return 0.0;
    }
    auto weights = normalized_weights();
    double mean = 0.0;
    double second = 0.0;
    for (size_t i = 0; i < samples_.size(); ++i) {
        double p = Core::dot(samples_[i].w, diff);
        mean += weights[i] * p;
        second += weights[i] * p * p;
    }
    double variance = second - mean * mean;
    return variance > 0.0 ? variance : 0.0;
}

double Belief::agreement(const std::vector<double>& diff) const {
    if (samples_.empty()) {
        return 0.0;
    }
    auto weights = normalized_weights();
    double fraction = 0.0;
    for (size_t i = 0; i < samples_.size(); ++i) {
        if (Core::dot(samples_[i].w, diff) > 0.0) {
            fraction += weights[i];
        }
    }
    return fraction;
}

bool Belief::operator==(const Belief& other) const {
    if (samples_.size() != other.samples_.size()) {
        return false;
    }
    for (size_t i = 0; i < samples_.size(); ++i) {
        if (samples_[i].w != other.samples_[i].w || samples_[i].weight != other.samples_[i].weight) {
            return false;
        }
    }
    return true;
}

} // namespace Sampling
} // namespace ActivePref
