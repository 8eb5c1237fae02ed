#pragma once

#include <cstddef>
#include <vector>

namespace ActivePref {
namespace Analysis {

struct LinearProgramResult {
    bool bounded = true;
    double objective = 0.0;
    std::vector<double> x;
    size_t iterations = 0;
};

/**
 * Dense simplex for small problems
 *
 *   minimize c . x  subject to  A x <= b,  x free,  b >= 0
 *
 * b >= 0 makes the origin feasible, so no phase one is needed. Free
 * variables are split as x = p - q with p, q >= 0. Bland's rule picks the
 * entering and leaving variables, which rules out cycling on the
 * degenerate vertices that homogeneous half-space systems produce.
 */
class LinearProgram {
public:
    explicit LinearProgram(std::vector<double> objective);

    size_t num_variables() const { return objective_.size(); }
    size_t num_constraints() const { return rows_.size(); }

    // Adds row . x <= bound; throws std::invalid_argument on a size mismatch or bound < 0
    void add_constraint(std::vector<double> row, double bound);

    // Throws std::runtime_error when the iteration cap is hit
    LinearProgramResult minimize(size_t max_iterations = 10000) const;

private:
    std::vector<double> objective_;
    std::vector<std::vector<double>> rows_;
    std::vector<double> bounds_;
};

} // namespace Analysis
} // namespace ActivePref
