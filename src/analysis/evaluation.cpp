#include "analysis/evaluation.hpp"
#include <cmath>
#include <random>
#include <stdexcept>

namespace ActivePref {
namespace Analysis {

namespace {

bool satisfies_all(const Core::WeightVector& w, const std::vector<Core::PreferenceConstraint>& constraints) {
    for (const auto& c : constraints) {
        if (c.answer == Core::ANSWER_ABOUT_EQUAL) {
            continue;
        }
        if (!(c.answer * Core::dot(w, c.delta) > 0.0)) {
            return false;
        }
    }
    return true;
}

void check_dimensions(const Core::WeightVector& reward, const std::vector<Core::PreferenceConstraint>& constraints) {
    for (const auto& c : constraints) {
        if (c.delta.size() != reward.size()) {
            throw Core::DimensionMismatchError("Constraint does not match reward dimension",
                                               reward.size(), c.delta.size());
        }
    }
}

} // namespace

double Evaluation::pass_rate(const Core::WeightVector& true_reward,
                             const std::vector<Core::PreferenceConstraint>& constraints,
                             double noise,
                             size_t n_rewards,
                             uint64_t seed) {
    if (n_rewards == 0) {
        throw std::invalid_argument("pass_rate needs at least one reward");
    }
    if (noise < 0.0 || !std::isfinite(noise)) {
        throw std::invalid_argument("Reward noise must be finite and non-negative");
    }
    check_dimensions(true_reward, constraints);

    std::mt19937_64 rng(seed);
    std::normal_distribution<double> gaussian(0.0, std::sqrt(noise));

    size_t passed = 0;
    for (size_t r = 0; r < n_rewards; ++r) {
        Core::WeightVector w = true_reward;
        if (noise > 0.0) {
            for (double& x : w) {
                x += gaussian(rng);
            }
        }
        if (Core::norm(w) == 0.0) {
            continue;
        }
        if (satisfies_all(Core::normalized(w), constraints)) {
            ++passed;
        }
    }
    return static_cast<double>(passed) / static_cast<double>(n_rewards);
}

double Evaluation::alignment(const Core::WeightVector& estimate, const Core::WeightVector& true_reward) {
    if (estimate.size() != true_reward.size()) {
        throw Core::DimensionMismatchError("Estimate does not match reward dimension",
                                           true_reward.size(), estimate.size());
    }
    return Core::cosine_similarity(estimate, true_reward);
}

double Evaluation::agreement(const Core::WeightVector& reward,
                             const std::vector<Core::PreferenceConstraint>& constraints) {
    check_dimensions(reward, constraints);
    size_t total = 0;
    size_t agreed = 0;
    for (const auto& c : constraints) {
        if (c.answer == Core::ANSWER_ABOUT_EQUAL) {
            continue;
        }
        ++total;
        if (c.answer * Core::dot(reward, c.delta) > 0.0) {
            ++agreed;
        }
    }
    return total > 0 ? static_cast<double>(agreed) / static_cast<double>(total) : 1.0;
}

} // namespace Analysis
} // namespace ActivePref
