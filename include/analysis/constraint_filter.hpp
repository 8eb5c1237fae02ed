#pragma once

#include "core/types.hpp"
#include "sampling/belief.hpp"
#include <vector>

namespace ActivePref {
namespace Analysis {

struct FilterOptions {
    double duplicate_precision = 1e-4;   // Cosine distance below which two normals are duplicates
    double noise_threshold = 0.7;        // Minimum belief agreement to keep a constraint
    double epsilon = 0.0;                // Required value gap
    double delta = 0.05;                 // Allowed probability of missing the gap
    double redundancy_tolerance = 1e-7;  // LP minimum above -tolerance counts as implied
    bool skip_remove_duplicates = false;
    bool skip_noise_filtering = false;
    bool skip_epsilon_filtering = false;
    bool skip_redundancy_filtering = false;
};

struct FilterReport {
    std::vector<size_t> kept;    // Indices into the input history, ascending
    size_t input = 0;
    size_t half_spaces = 0;      // "About equal" answers define no half-space and are dropped
    size_t after_duplicates = 0;
    size_t after_noise = 0;
    size_t after_epsilon = 0;
    size_t after_redundancy = 0;
};

/**
 * Turns a preference history into a clean set of half-space tests.
 *
 * Every stage returns indices into the vector it was given. Constraints
 * answered "about equal" are never kept.
 */
class ConstraintFilter {
public:
    static std::vector<size_t> remove_duplicates(const std::vector<Core::PreferenceConstraint>& constraints,
                                                 double precision);

    // Keep constraints that more than `threshold` of the belief satisfies
    static std::vector<size_t> filter_noise(const std::vector<Core::PreferenceConstraint>& constraints,
                                            const Sampling::Belief& belief,
                                            double threshold);

    // Keep constraints whose value gap exceeds epsilon with probability above 1 - delta
    static std::vector<size_t> filter_epsilon_delta(const std::vector<Core::PreferenceConstraint>& constraints,
                                                    const Sampling::Belief& belief,
                                                    double epsilon,
                                                    double delta);

    /**
     * Drop half-spaces implied by the others.
     *
     * Constraint i is redundant when min n_i . w over the cone of the remaining
     * constraints, boxed to [-1, 1]^D, is not negative. Constraints are tested
     * in order and a redundant one is removed before the next test, so of two
     * equivalent constraints the later one is kept.
     */
    static std::vector<size_t> remove_redundant(const std::vector<Core::PreferenceConstraint>& constraints,
                                                double tolerance = 1e-7);

    static FilterReport run(const std::vector<Core::PreferenceConstraint>& constraints,
                            const Sampling::Belief& belief,
                            const FilterOptions& options);
};

} // namespace Analysis
} // namespace ActivePref
