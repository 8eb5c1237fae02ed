#include "analysis/linear_program.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace ActivePref {
namespace Analysis {

namespace {

constexpr double PIVOT_TOLERANCE = 1e-12;

} // namespace

LinearProgram::LinearProgram(std::vector<double> objective) : objective_(std::move(objective)) {
    if (objective_.empty()) {
        throw std::invalid_argument("Linear program needs at least one variable");
    }
}

void LinearProgram::add_constraint(std::vector<double> row, double bound) {
    if (row.size() != objective_.size()) {
        throw std::invalid_argument("Constraint has " + std::to_string(row.size()) +
                                    " coefficients, expected " + std::to_string(objective_.size()));
    }
    if (!(bound >= 0.0)) {
        throw std::invalid_argument("Constraint bound must be non-negative");
    }
    rows_.push_back(std::move(row));
    bounds_.push_back(bound);
}

LinearProgramResult LinearProgram::minimize(size_t max_iterations) const {
    const size_t n = objective_.size();
    const size_t m = rows_.size();
    const size_t structural = 2 * n;          // p then q
    const size_t columns = structural + m;    // then one slack per row
    const size_t rhs = columns;

    // Tableau rows 0..m-1 are constraints, row m holds reduced costs and -objective
    std::vector<std::vector<double>> tableau(m + 1, std::vector<double>(columns + 1, 0.0));
    std::vector<size_t> basis(m);
    for (size_t i = 0; i < m; ++i) {
        for (size_t j = 0; j < n; ++j) {
            tableau[i][j] = rows_[i][j];
            tableau[i][n + j] = -rows_[i][j];
        }
        tableau[i][structural + i] = 1.0;
        tableau[i][rhs] = bounds_[i];
        basis[i] = structural + i;
    }
    for (size_t j = 0; j < n; ++j) {
        tableau[m][j] = objective_[j];
        tableau[m][n + j] = -objective_[j];
    }

    LinearProgramResult result;
    while (true) {
        // Entering column: lowest index with a negative reduced cost
        size_t entering = columns;
        for (size_t j = 0; j < columns; ++j) {
            if (tableau[m][j] < -PIVOT_TOLERANCE) {
                entering = j;
                break;
            }
        }
        if (entering == columns) {
            break;
        }

        if (result.iterations >= max_iterations) {
            throw std::runtime_error("Simplex did not converge in " + std::to_string(max_iterations) +
                                     " iterations");
        }
        ++result.iterations;

        // Leaving row: minimum ratio, ties to the lowest basic index
        size_t leaving = m;
        double best_ratio = std::numeric_limits<double>::infinity();
        for (size_t i = 0; i < m; ++i) {
            if (tableau[i][entering] > PIVOT_TOLERANCE) {
                double ratio = tableau[i][rhs] / tableau[i][entering];
                if (ratio < best_ratio - PIVOT_TOLERANCE ||
                    (std::fabs(ratio - best_ratio) <= PIVOT_TOLERANCE && leaving < m &&
                     basis[i] < basis[leaving])) {
                    best_ratio = ratio;
                    leaving = i;
                }
            }
        }
        if (leaving == m) {
            result.bounded = false;
            result.objective = -std::numeric_limits<double>::infinity();
            return result;
        }

        const double pivot = tableau[leaving][entering];
        for (double& value : tableau[leaving]) {
            value /= pivot;
        }
        for (size_t i = 0; i <= m; ++i) {
            if (i == leaving) {
                continue;
            }
            const double factor = tableau[i][entering];
            if (factor == 0.0) {
                continue;
            }
            for (size_t j = 0; j <= columns; ++j) {
                tableau[i][j] -= factor * tableau[leaving][j];
            }
        }
        basis[leaving] = entering;
    }

    result.objective = -tableau[m][rhs];
    result.x.assign(n, 0.0);
    for (size_t i = 0; i < m; ++i) {
        if (basis[i] < n) {
            result.x[basis[i]] += tableau[i][rhs];
        } else if (basis[i] < structural) {
            result.x[basis[i] - n] -= tableau[i][rhs];
        }
    }
    return result;
}

} // namespace Analysis
} // namespace ActivePref
