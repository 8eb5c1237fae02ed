#pragma once

#include "acquisition/candidate_source.hpp"
#include "core/types.hpp"
#include "model/preference_model.hpp"
#include "sampling/belief.hpp"
#include "utils/logger.hpp"
#include <cstdint>
#include <vector>

namespace ActivePref {
namespace Acquisition {

struct AcquisitionResult {
    Core::Query query;
    double score = 0.0;
};

/**
 * Chooses the next query for the current belief.
 *
 * Information: mutual information between the answer and the weights,
 *   H(mean_m P(s|w_m)) - mean_m H(P(s|w_m)).
 * Volume: expected fraction of belief mass removed by the answer,
 *   sum_s p(s) (1 - p(s)), p(s) = mean_m P(s|w_m).
 * Random: uniform over the candidate source, scored 0.
 */
class AcquisitionEngine {
public:
    AcquisitionEngine(Core::Criterion criterion, const Model::PreferenceModel& model, uint64_t seed);

    Core::Criterion criterion() const { return criterion_; }

    // Non-negative; 0 once all samples predict the same answer distribution
    double information_gain(const Sampling::Belief& belief, const std::vector<double>& diff) const;
    double volume_removal(const Sampling::Belief& belief, const std::vector<double>& diff) const;

    // Criterion-specific score of one query
    double score(const Sampling::Belief& belief, const std::vector<double>& diff) const;

    /**
     * Select the next query
     * @param query_index Number of queries already asked; seeds random selection
     * @throws std::invalid_argument on an empty belief
     * @throws Core::NoCandidatesError if the source has nothing to offer
     */
    AcquisitionResult next_query(const Sampling::Belief& belief,
                                 CandidateSource& source,
                                 size_t query_index);

    /**
     * Largest volume removal any candidate offers, 0 once the belief agrees on every pair.
     * Used to stop random selection, which never looks at the belief itself.
     */
    double best_volume_removal(const Sampling::Belief& belief,
                               CandidateSource& source,
                               size_t query_index) const;

    size_t queries_selected() const { return queries_selected_; }

private:
    // Weighted mean answer distribution and mean answer entropy
    void answer_statistics(const Sampling::Belief& belief,
                           const std::vector<double>& diff,
                           std::vector<double>& mean_probabilities,
                           double& mean_entropy) const;

    Core::Criterion criterion_;
    Model::PreferenceModel model_;
    uint64_t seed_;
    size_t queries_selected_;
    Utils::ModuleLogger logger_;
};

} // namespace Acquisition
} // namespace ActivePref
