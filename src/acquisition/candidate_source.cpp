#include "acquisition/candidate_source.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <omp.h>

namespace ActivePref {
namespace Acquisition {

// DatabaseCandidateSource

DatabaseCandidateSource::DatabaseCandidateSource(size_t dimension, std::vector<Core::CandidatePair> pairs)
    : dimension_(dimension), pairs_(std::move(pairs)) {
    if (dimension_ == 0) {
        throw std::invalid_argument("Candidate dimension must be positive");
    }
    differences_.reserve(pairs_.size());
    for (const auto& pair : pairs_) {
        if (pair.a.features.size() != dimension_ || pair.b.features.size() != dimension_) {
            throw Core::DimensionMismatchError("Candidate pair (" + pair.a.id + ", " + pair.b.id +
                                               ") has wrong feature count",
                                               dimension_, std::max(pair.a.features.size(),
                                                                    pair.b.features.size()));
        }
        differences_.push_back(pair.difference());
    }
}

DatabaseCandidateSource::DatabaseCandidateSource(const Data::TrajectoryDatabase& database)
    : DatabaseCandidateSource(database.dimension(), database.candidate_pairs()) {}

std::vector<double> DatabaseCandidateSource::score_all(const ScoreFn& score) const {
    std::vector<double> scores(pairs_.size());

    #pragma omp parallel for schedule(static)
    for (long i = 0; i < static_cast<long>(differences_.size()); ++i) {
        scores[i] = score(differences_[i]);
    }
    return scores;
}

ScoredPair DatabaseCandidateSource::best_pair(const ScoreFn& score, uint64_t /*seed*/) {
    if (pairs_.empty()) {
        throw Core::NoCandidatesError("Candidate database is empty");
    }

    std::vector<double> scores = score_all(score);

    size_t best = 0;
    for (size_t i = 1; i < scores.size(); ++i) {
        if (scores[i] > scores[best]) {
            best = i;
        }
    }
    return {pairs_[best], scores[best]};
}

Core::CandidatePair DatabaseCandidateSource::random_pair(uint64_t seed) {
    if (pairs_.empty()) {
        throw Core::NoCandidatesError("Candidate database is empty");
    }
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, pairs_.size() - 1);
    return pairs_[pick(rng)];
}

// ContinuousCandidateSource

ContinuousCandidateSource::ContinuousCandidateSource(std::shared_ptr<const ControlFeatureModel> model,
                                                     ContinuousSearchConfig config)
    : model_(std::move(model)), config_(config), evaluations_(0), logger_("CONTINUOUS") {
    if (!model_) {
        throw std::invalid_argument("Continuous candidate source needs a feature model");
    }
    const size_t cd = model_->control_dimension();
    std::vector<double> lower = model_->lower_bounds();
    std::vector<double> upper = model_->upper_bounds();
    if (cd == 0 || lower.size() != cd || upper.size() != cd) {
        throw Core::DimensionMismatchError("Control bounds do not match control dimension",
                                           cd, lower.size());
    }
    for (size_t i = 0; i < cd; ++i) {
        if (!(lower[i] <= upper[i])) {
            throw std::invalid_argument("Control lower bound exceeds upper bound at index " +
                                        std::to_string(i));
        }
    }
    if (config_.restarts == 0 || config_.max_iterations == 0) {
        throw std::invalid_argument("Continuous search needs at least one restart and iteration");
    }
    if (!(config_.initial_step > 0.0) || !(config_.min_step > 0.0)) {
        throw std::invalid_argument("Continuous search steps must be positive");
    }

    // Joint search space (x_a, x_b)
    lower_ = lower;
    lower_.insert(lower_.end(), lower.begin(), lower.end());
    upper_ = upper;
    upper_.insert(upper_.end(), upper.begin(), upper.end());
}

Core::Trajectory ContinuousCandidateSource::make_trajectory(const std::string& id,
                                                            std::vector<double> controls) const {
    Core::Trajectory trajectory;
    trajectory.id = id;
    trajectory.features = model_->features(controls);
    if (trajectory.features.size() != model_->dimension()) {
        throw Core::DimensionMismatchError("Feature model returned wrong feature count",
                                           model_->dimension(), trajectory.features.size());
    }
    trajectory.controls = std::move(controls);
    return trajectory;
}

double ContinuousCandidateSource::evaluate(const ScoreFn& score, const std::vector<double>& joint) {
    const size_t cd = model_->control_dimension();
    std::vector<double> xa(joint.begin(), joint.begin() + cd);
    std::vector<double> xb(joint.begin() + cd, joint.end());
    std::vector<double> fa = model_->features(xa);
    std::vector<double> fb = model_->features(xb);
    if (fa.size() != model_->dimension() || fb.size() != model_->dimension()) {
        throw Core::DimensionMismatchError("Feature model returned wrong feature count",
                                           model_->dimension(), fa.size());
    }
    std::vector<double> diff(fa.size());
    for (size_t i = 0; i < diff.size(); ++i) {
        diff[i] = fa[i] - fb[i];
    }
    ++evaluations_;
    return score(diff);
}

ScoredPair ContinuousCandidateSource::optimize_for_acquisition(const ScoreFn& score, uint64_t seed) {
    auto start_time = std::chrono::steady_clock::now();
    std::mt19937_64 rng(seed);
    const size_t n = lower_.size();

    std::vector<double> best_x;
    double best_score = -std::numeric_limits<double>::infinity();

    for (size_t restart = 0; restart < config_.restarts; ++restart) {
        std::vector<double> x(n);
        for (size_t i = 0; i < n; ++i) {
            std::uniform_real_distribution<double> dist(lower_[i], upper_[i]);
            x[i] = lower_[i] == upper_[i] ? lower_[i] : dist(rng);
        }
        double fx = evaluate(score, x);

        double step = config_.initial_step;
        size_t iterations = 1;
        while (step >= config_.min_step && iterations < config_.max_iterations) {
            bool improved = false;
            for (size_t i = 0; i < n && !improved && iterations < config_.max_iterations; ++i) {
                const double range = upper_[i] - lower_[i];
                if (range == 0.0) {
                    continue;
                }
                for (double direction : {1.0, -1.0}) {
                    std::vector<double> y = x;
                    y[i] = std::clamp(x[i] + direction * step * range, lower_[i], upper_[i]);
                    if (y[i] == x[i]) {
                        continue;
                    }
                    double fy = evaluate(score, y);
                    ++iterations;
                    if (fy > fx) {
                        x = std::move(y);
                        fx = fy;
                        improved = true;
                        break;
                    }
                    if (iterations >= config_.max_iterations) {
                        break;
                    }
                }
            }
            if (!improved) {
                step *= 0.5;
            }
        }

        if (fx > best_score) {
            best_score = fx;
            best_x = x;
        }
    }

    const size_t cd = model_->control_dimension();
    std::ostringstream tag;
    tag << std::hex << seed;
    ScoredPair result;
    result.pair.a = make_trajectory("continuous-" + tag.str() + "-a",
                                    std::vector<double>(best_x.begin(), best_x.begin() + cd));
    result.pair.b = make_trajectory("continuous-" + tag.str() + "-b",
                                    std::vector<double>(best_x.begin() + cd, best_x.end()));
    result.score = best_score;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    logger_.debug("Control-space search finished in " + std::to_string(elapsed) + " ms, best score " +
                  std::to_string(best_score));
    return result;
}

ScoredPair ContinuousCandidateSource::best_pair(const ScoreFn& score, uint64_t seed) {
    return optimize_for_acquisition(score, seed);
}

Core::CandidatePair ContinuousCandidateSource::random_pair(uint64_t seed) {
    std::mt19937_64 rng(seed);
    const size_t cd = model_->control_dimension();
    std::vector<double> xa(cd);
    std::vector<double> xb(cd);
    for (size_t i = 0; i < cd; ++i) {
        std::uniform_real_distribution<double> dist(lower_[i], upper_[i]);
        xa[i] = lower_[i] == upper_[i] ? lower_[i] : dist(rng);
    }
    for (size_t i = 0; i < cd; ++i) {
        std::uniform_real_distribution<double> dist(lower_[i], upper_[i]);
        xb[i] = lower_[i] == upper_[i] ? lower_[i] : dist(rng);
    }
    std::ostringstream tag;
    tag << std::hex << seed;
    return {make_trajectory("random-" + tag.str() + "-a", std::move(xa)),
            make_trajectory("random-" + tag.str() + "-b", std::move(xb))};
}

} // namespace Acquisition
} // namespace ActivePref
