#pragma once

#include "core/types.hpp"
#include <vector>

namespace ActivePref {
namespace Model {

struct PreferenceModelParams {
    double delta = 0.0;   // Equivalence threshold of weak queries (0 disables "about equal")
    double beta = 1.0;    // Rationality; scales w . diff before the weak link function
};

/**
 * Likelihood of a human answer to a pairwise query.
 *
 * Strict queries are a deterministic function of sign(w . diff). Weak
 * queries use the threshold model
 *   P(A) = 1 / (1 + exp(d - z)),  P(B) = 1 / (1 + exp(d + z)),
 *   P(equal) = 1 - P(A) - P(B),   z = beta * (w . diff),
 * which is graded strictly inside (0, 1) for every finite z.
 *
 * All member functions are pure.
 */
class PreferenceModel {
public:
    PreferenceModel(Core::QueryType type, PreferenceModelParams params = {});

    Core::QueryType type() const { return type_; }
    const PreferenceModelParams& params() const { return params_; }

    // Possible answers for this query type
    const std::vector<int>& answers() const { return answers_; }

    /**
     * Probability of an answer given weights and the feature difference
     * @param w Weight vector
     * @param diff features(A) - features(B)
     * @param answer +1, -1 or 0
     */
    double answer_probability(const Core::WeightVector& w,
                              const std::vector<double>& diff,
                              int answer) const;

    // Natural log of answer_probability; -infinity for impossible answers
    double log_likelihood(const Core::WeightVector& w,
                          const std::vector<double>& diff,
                          int answer) const;

    // Same, from a precomputed projection w . diff
    double log_likelihood_from_projection(double projection, int answer) const;
    double probability_from_projection(double projection, int answer) const;

    double constraint_log_likelihood(const Core::WeightVector& w,
                                     const Core::PreferenceConstraint& constraint) const;

    // Sum over a constraint history
    double total_log_likelihood(const Core::WeightVector& w,
                                const std::vector<Core::PreferenceConstraint>& constraints) const;

    // Throws std::invalid_argument if the answer cannot be recorded under this model
    void validate_answer(int answer) const;

private:
    Core::QueryType type_;
    PreferenceModelParams params_;
    std::vector<int> answers_;
};

} // namespace Model
} // namespace ActivePref
