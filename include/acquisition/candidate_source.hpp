#pragma once

#include "acquisition/feature_store.hpp"
#include "core/types.hpp"
#include "data/trajectory_database.hpp"
#include "utils/logger.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ActivePref {
namespace Acquisition {

// Acquisition score of a query as a function of features(A) - features(B).
// Must be safe to call concurrently.
using ScoreFn = std::function<double(const std::vector<double>& diff)>;

struct ScoredPair {
    Core::CandidatePair pair;
    double score = 0.0;
};

// Where queries come from. The engine never constructs trajectories itself.
class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    virtual std::string name() const = 0;
    virtual size_t dimension() const = 0;

    // Pair maximizing the score; seed drives any internal randomness
    virtual ScoredPair best_pair(const ScoreFn& score, uint64_t seed) = 0;

    // Uniformly random pair
    virtual Core::CandidatePair random_pair(uint64_t seed) = 0;
};

/**
 * Finite, precomputed set of candidate pairs
 *
 * Scoring is exhaustive and runs in parallel over candidates; the arg-max is
 * taken sequentially afterwards so ties resolve to the first pair in
 * enumeration order regardless of thread count.
 */
class DatabaseCandidateSource : public CandidateSource {
public:
    DatabaseCandidateSource(size_t dimension, std::vector<Core::CandidatePair> pairs);
    explicit DatabaseCandidateSource(const Data::TrajectoryDatabase& database);

    std::string name() const override { return "database"; }
    size_t dimension() const override { return dimension_; }

    const std::vector<Core::CandidatePair>& candidate_pairs() const { return pairs_; }
    size_t size() const { return pairs_.size(); }

    // @throws Core::NoCandidatesError on an empty set
    ScoredPair best_pair(const ScoreFn& score, uint64_t seed) override;
    Core::CandidatePair random_pair(uint64_t seed) override;

    // Scores for every candidate, in enumeration order
    std::vector<double> score_all(const ScoreFn& score) const;

private:
    size_t dimension_;
    std::vector<Core::CandidatePair> pairs_;
    std::vector<std::vector<double>> differences_;
};

struct ContinuousSearchConfig {
    size_t restarts = 8;             // Random starting points
    size_t max_iterations = 400;     // Score evaluations per restart
    double initial_step = 0.25;      // Fraction of each control's range
    double min_step = 1e-3;          // Stop a restart once the step shrinks below this
};

/**
 * Searches control space directly instead of a database
 *
 * Each query runs a bounded compass search over the joint controls (x_a, x_b)
 * from several random restarts. Every score evaluation rolls out two
 * trajectories through the feature model, so this is slow compared with the
 * database source.
 */
class ContinuousCandidateSource : public CandidateSource {
public:
    ContinuousCandidateSource(std::shared_ptr<const ControlFeatureModel> model,
                              ContinuousSearchConfig config = {});

    std::string name() const override { return "continuous"; }
    size_t dimension() const override { return model_->dimension(); }

    ScoredPair optimize_for_acquisition(const ScoreFn& score, uint64_t seed);

    ScoredPair best_pair(const ScoreFn& score, uint64_t seed) override;
    Core::CandidatePair random_pair(uint64_t seed) override;

    size_t evaluations() const { return evaluations_; }

private:
    Core::Trajectory make_trajectory(const std::string& id, std::vector<double> controls) const;
    double evaluate(const ScoreFn& score, const std::vector<double>& joint);

    std::shared_ptr<const ControlFeatureModel> model_;
    ContinuousSearchConfig config_;
    std::vector<double> lower_;
    std::vector<double> upper_;
    size_t evaluations_;
    Utils::ModuleLogger logger_;
};

} // namespace Acquisition
} // namespace ActivePref
