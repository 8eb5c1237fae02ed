#include "analysis/constraint_filter.hpp"
#include "analysis/linear_program.hpp"
#include "utils/logger.hpp"
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace ActivePref {
namespace Analysis {

namespace {

bool is_half_space(const Core::PreferenceConstraint& c) {
    return c.answer != Core::ANSWER_ABOUT_EQUAL && Core::norm(c.delta) > 0.0;
}

// Weighted fraction of samples with w . normal > margin
double belief_support(const Sampling::Belief& belief, const std::vector<double>& normal, double margin) {
    const std::vector<double> weights = belief.normalized_weights();
    double support = 0.0;
    for (size_t m = 0; m < belief.size(); ++m) {
        if (Core::dot(belief[m].w, normal) > margin) {
            support += weights[m];
        }
    }
    return support;
}

std::vector<Core::PreferenceConstraint> select(const std::vector<Core::PreferenceConstraint>& constraints,
                                               const std::vector<size_t>& indices) {
    std::vector<Core::PreferenceConstraint> out;
    out.reserve(indices.size());
    for (size_t i : indices) {
        out.push_back(constraints[i]);
    }
    return out;
}

// Map stage-local indices back to the original history
std::vector<size_t> compose(const std::vector<size_t>& outer, const std::vector<size_t>& inner) {
    std::vector<size_t> out;
    out.reserve(inner.size());
    for (size_t i : inner) {
        out.push_back(outer[i]);
    }
    return out;
}

} // namespace

std::vector<size_t> ConstraintFilter::remove_duplicates(const std::vector<Core::PreferenceConstraint>& constraints,
                                                        double precision) {
    std::vector<size_t> kept;
    std::vector<std::vector<double>> accepted;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (!is_half_space(constraints[i])) {
            continue;
        }
        std::vector<double> normal = constraints[i].oriented();
        bool duplicate = false;
        for (const auto& other : accepted) {
            if (1.0 - Core::cosine_similarity(normal, other) < precision) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            accepted.push_back(std::move(normal));
            kept.push_back(i);
        }
    }
    return kept;
}

std::vector<size_t> ConstraintFilter::filter_noise(const std::vector<Core::PreferenceConstraint>& constraints,
                                                   const Sampling::Belief& belief,
                                                   double threshold) {
    if (belief.empty()) {
        throw std::invalid_argument("Noise filtering needs a non-empty belief");
    }
    std::vector<size_t> kept;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (!is_half_space(constraints[i])) {
            continue;
        }
        if (belief_support(belief, constraints[i].oriented(), 0.0) > threshold) {
            kept.push_back(i);
        }
    }
    return kept;
}

std::vector<size_t> ConstraintFilter::filter_epsilon_delta(const std::vector<Core::PreferenceConstraint>& constraints,
                                                           const Sampling::Belief& belief,
                                                           double epsilon,
                                                           double delta) {
    if (belief.empty()) {
        throw std::invalid_argument("Epsilon-delta filtering needs a non-empty belief");
    }
    if (delta < 0.0 || delta > 1.0) {
        throw std::invalid_argument("Filter delta must lie in [0, 1]");
    }
    std::vector<size_t> kept;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (!is_half_space(constraints[i])) {
            continue;
        }
        if (belief_support(belief, constraints[i].oriented(), epsilon) > 1.0 - delta) {
            kept.push_back(i);
        }
    }
    return kept;
}

std::vector<size_t> ConstraintFilter::remove_redundant(const std::vector<Core::PreferenceConstraint>& constraints,
                                                       double tolerance) {
    std::vector<size_t> active;
    std::vector<std::vector<double>> normals(constraints.size());
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (is_half_space(constraints[i])) {
            normals[i] = Core::normalized(constraints[i].oriented());
            active.push_back(i);
        }
    }
    if (active.empty()) {
        return active;
    }
    const size_t dimension = normals[active.front()].size();

    size_t position = 0;
    while (position < active.size()) {
        const size_t candidate = active[position];

        LinearProgram lp(normals[candidate]);
        for (size_t other : active) {
            if (other == candidate) {
                continue;
            }
            if (normals[other].size() != dimension) {
                throw Core::DimensionMismatchError("Constraint dimensions differ", dimension,
                                                   normals[other].size());
            }
            std::vector<double> row(dimension);
            for (size_t d = 0; d < dimension; ++d) {
                row[d] = -normals[other][d];
            }
            lp.add_constraint(std::move(row), 0.0);
        }
        for (size_t d = 0; d < dimension; ++d) {
            std::vector<double> upper(dimension, 0.0);
            upper[d] = 1.0;
            lp.add_constraint(upper, 1.0);
            std::vector<double> lower(dimension, 0.0);
            lower[d] = -1.0;
            lp.add_constraint(std::move(lower), 1.0);
        }

        if (lp.minimize().objective >= -tolerance) {
            active.erase(active.begin() + static_cast<std::ptrdiff_t>(position));
        } else {
            ++position;
        }
    }
    return active;
}

FilterReport ConstraintFilter::run(const std::vector<Core::PreferenceConstraint>& constraints,
                                   const Sampling::Belief& belief,
                                   const FilterOptions& options) {
    Utils::ModuleLogger logger("ANALYSIS");

    FilterReport report;
    report.input = constraints.size();

    std::vector<size_t> indices;
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (is_half_space(constraints[i])) {
            indices.push_back(i);
        }
    }
    report.half_spaces = indices.size();

    if (!options.skip_remove_duplicates) {
        indices = compose(indices, remove_duplicates(select(constraints, indices), options.duplicate_precision));
        logger.info("After removing duplicates, there are " + std::to_string(indices.size()) + " questions");
    }
    report.after_duplicates = indices.size();

    if (!options.skip_noise_filtering) {
        indices = compose(indices, filter_noise(select(constraints, indices), belief, options.noise_threshold));
        logger.info("After noise filtering there are " + std::to_string(indices.size()) + " questions");
    }
    report.after_noise = indices.size();

    if (!options.skip_epsilon_filtering && !indices.empty()) {
        indices = compose(indices, filter_epsilon_delta(select(constraints, indices), belief,
                                                        options.epsilon, options.delta));
        logger.info("After epsilon-delta filtering there are " + std::to_string(indices.size()) + " questions");
    }
    report.after_epsilon = indices.size();

    if (!options.skip_redundancy_filtering && !indices.empty()) {
        indices = compose(indices, remove_redundant(select(constraints, indices), options.redundancy_tolerance));
        logger.info("After removing redundancies there are " + std::to_string(indices.size()) + " questions");
    }
    report.after_redundancy = indices.size();

    report.kept = std::move(indices);
    return report;
}

} // namespace Analysis
} // namespace ActivePref
