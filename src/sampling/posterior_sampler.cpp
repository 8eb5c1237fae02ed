#include "sampling/posterior_sampler.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <omp.h>

namespace ActivePref {
namespace Sampling {

namespace {

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

std::string format_rate(double rate) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << rate;
    return oss.str();
}

} // namespace

void SamplerConfig::validate() const {
    if (thin == 0) {
        throw std::invalid_argument("Sampler thin must be at least 1");
    }
    if (!(step_size > 0.0) || !std::isfinite(step_size)) {
        throw std::invalid_argument("Sampler step_size must be finite and positive");
    }
    if (num_chains == 0) {
        throw std::invalid_argument("Sampler needs at least one chain");
    }
    if (max_consecutive_rejections == 0 || max_init_attempts == 0) {
        throw std::invalid_argument("Sampler rejection limits must be positive");
    }
}

PosteriorSampler::PosteriorSampler(SamplerConfig config)
    : config_(config), logger_("SAMPLER") {
    config_.validate();
}

Core::WeightVector PosteriorSampler::random_direction(size_t dimension, std::mt19937_64& rng) const {
    std::normal_distribution<double> gauss(0.0, 1.0);
    Core::WeightVector w(dimension);
    double n = 0.0;
    do {
        for (double& x : w) {
            x = gauss(rng);
        }
        n = Core::norm(w);
    } while (n == 0.0);
    for (double& x : w) {
        x /= n;
    }
    return w;
}

Core::WeightVector PosteriorSampler::propose(const Core::WeightVector& current, std::mt19937_64& rng) const {
    std::normal_distribution<double> gauss(0.0, config_.step_size);
    Core::WeightVector proposal(current.size());
    double n = 0.0;
    do {
        for (size_t i = 0; i < current.size(); ++i) {
            proposal[i] = current[i] + gauss(rng);
        }
        n = Core::norm(proposal);
    } while (n == 0.0);
    for (double& x : proposal) {
        x /= n;
    }
    return proposal;
}

Belief PosteriorSampler::sample_prior(size_t dimension, size_t num_samples, uint64_t seed) const {
    if (dimension == 0) {
        throw std::invalid_argument("Weight dimension must be positive");
    }
    std::mt19937_64 rng(seed);
    std::vector<WeightedSample> samples;
    samples.reserve(num_samples);
    for (size_t i = 0; i < num_samples; ++i) {
        samples.push_back({random_direction(dimension, rng), 1.0});
    }
    return Belief(std::move(samples));
}

void PosteriorSampler::run_chain(const std::vector<Core::PreferenceConstraint>& constraints,
                                 const Model::PreferenceModel& model,
                                 Core::WeightVector start,
                                 size_t count,
                                 std::mt19937_64& rng,
                                 ChainResult& result) const {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    Core::WeightVector current = std::move(start);
    double current_ll = model.total_log_likelihood(current, constraints);

    const size_t total_steps = config_.burn_in + count * config_.thin;
    size_t consecutive_rejections = 0;
    result.samples.reserve(count);

    for (size_t step = 1; step <= total_steps; ++step) {
        Core::WeightVector proposal = propose(current, rng);
        double proposal_ll = model.total_log_likelihood(proposal, constraints);

        bool accept = false;
        if (proposal_ll != NEG_INF) {
            if (proposal_ll >= current_ll) {
                accept = true;
            } else {
                accept = std::log(uniform(rng)) < proposal_ll - current_ll;
            }
        }

        ++result.proposals;
        if (accept) {
            current = std::move(proposal);
            current_ll = proposal_ll;
            ++result.accepted;
            consecutive_rejections = 0;
        } else if (++consecutive_rejections > config_.max_consecutive_rejections) {
            result.failed = true;
            result.error = "chain rejected " + std::to_string(consecutive_rejections) +
                           " consecutive proposals with " + std::to_string(constraints.size()) +
                           " constraints (acceptance rate " +
                           format_rate(static_cast<double>(result.accepted) / result.proposals) + ")";
            return;
        }

        if (step > config_.burn_in && (step - config_.burn_in) % config_.thin == 0) {
            result.samples.push_back(current);
        }
    }
}

Belief PosteriorSampler::sample(const std::vector<Core::PreferenceConstraint>& constraints,
                                const Model::PreferenceModel& model,
                                size_t dimension,
                                size_t num_samples,
                                uint64_t seed,
                                const Belief* previous) {
    if (dimension == 0) {
        throw std::invalid_argument("Weight dimension must be positive");
    }
    if (num_samples == 0) {
        throw std::invalid_argument("Sample count must be positive");
    }
    for (const auto& constraint : constraints) {
        if (constraint.delta.size() != dimension) {
            throw Core::DimensionMismatchError("Constraint dimension does not match weights",
                                               dimension, constraint.delta.size());
        }
        model.validate_answer(constraint.answer);
    }

    // Rank previous samples by likelihood under the extended history
    std::vector<size_t> feasible;
    if (previous != nullptr && !previous->empty()) {
        if (previous->dimension() != dimension) {
            throw Core::DimensionMismatchError("Previous belief dimension does not match",
                                               dimension, previous->dimension());
        }
        std::vector<double> lls(previous->size());
        for (size_t i = 0; i < previous->size(); ++i) {
            lls[i] = model.total_log_likelihood((*previous)[i].w, constraints);
            if (lls[i] != NEG_INF) {
                feasible.push_back(i);
            }
        }
        std::stable_sort(feasible.begin(), feasible.end(),
                         [&lls](size_t a, size_t b) { return lls[a] > lls[b]; });
    }

    const size_t chains = std::min(config_.num_chains, num_samples);
    std::vector<ChainResult> results(chains);

    #pragma omp parallel for schedule(static)
    for (long c = 0; c < static_cast<long>(chains); ++c) {
        ChainResult& result = results[c];
        try {
            std::mt19937_64 rng(Core::derive_seed(seed, static_cast<uint64_t>(c)));

            Core::WeightVector start;
            if (!feasible.empty()) {
                start = (*previous)[feasible[c % feasible.size()]].w;
                result.seeded_from_previous = true;
            } else {
                bool found = false;
                for (size_t attempt = 0; attempt < config_.max_init_attempts; ++attempt) {
                    Core::WeightVector candidate = random_direction(dimension, rng);
                    if (model.total_log_likelihood(candidate, constraints) != NEG_INF) {
                        start = std::move(candidate);
                        found = true;
                        break;
                    }
                }
                if (!found) {
                    result.failed = true;
                    result.error = "no weight vector consistent with all " +
                                   std::to_string(constraints.size()) + " constraints found in " +
                                   std::to_string(config_.max_init_attempts) + " prior draws";
                    continue;
                }
            }

            size_t count = num_samples / chains + (static_cast<size_t>(c) < num_samples % chains ? 1 : 0);
            run_chain(constraints, model, std::move(start), count, rng, result);
        } catch (const std::exception& e) {
            result.failed = true;
            result.error = e.what();
        }
    }

    last_stats_ = SamplerStats();
    last_stats_.chains = chains;
    std::vector<WeightedSample> samples;
    samples.reserve(num_samples);
    for (size_t c = 0; c < chains; ++c) {
        const ChainResult& result = results[c];
        if (result.failed) {
            logger_.error("Chain " + std::to_string(c) + " degenerate: " + result.error);
            throw Core::DegenerateChainError("Posterior chain " + std::to_string(c) +
                                             " is degenerate: " + result.error +
                                             "; the preference history may be inconsistent");
        }
        last_stats_.proposals += result.proposals;
        last_stats_.accepted += result.accepted;
        if (result.seeded_from_previous) {
            ++last_stats_.chains_seeded_from_previous;
        }
        for (const auto& w : result.samples) {
            samples.push_back({w, 1.0});
        }
    }

    logger_.debug("Drew " + std::to_string(samples.size()) + " samples from " +
                  std::to_string(chains) + " chain(s), " + std::to_string(constraints.size()) +
                  " constraints, acceptance rate " + format_rate(last_stats_.acceptance_rate()));

    return Belief(std::move(samples));
}

} // namespace Sampling
} // namespace ActivePref
