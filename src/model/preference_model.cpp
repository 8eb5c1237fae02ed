#include "model/preference_model.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace ActivePref {
namespace Model {

namespace {

// log(1 + exp(x)) without overflow
double softplus(double x) {
    if (x > 30.0) {
        return x + std::log1p(std::exp(-x));
    }
    return std::log1p(std::exp(x));
}

constexpr double NEG_INF = -std::numeric_limits<double>::infinity();

// log(e^x - 1) for x > 0; the direct form overflows past x ~ 709
double log_expm1(double x) {
    if (x > 1.0) {
        return x + std::log1p(-std::exp(-x));
    }
    return std::log(std::expm1(x));
}

} // namespace

PreferenceModel::PreferenceModel(Core::QueryType type, PreferenceModelParams params)
    : type_(type), params_(params) {
    if (params_.delta < 0.0 || !std::isfinite(params_.delta)) {
        throw std::invalid_argument("Preference model delta must be finite and non-negative");
    }
    if (!(params_.beta > 0.0) || !std::isfinite(params_.beta)) {
        throw std::invalid_argument("Preference model beta must be finite and positive");
    }

    if (type_ == Core::QueryType::Strict) {
        answers_ = {Core::ANSWER_PREFER_A, Core::ANSWER_PREFER_B};
    } else {
        answers_ = {Core::ANSWER_PREFER_A, Core::ANSWER_PREFER_B, Core::ANSWER_ABOUT_EQUAL};
    }
}

void PreferenceModel::validate_answer(int answer) const {
    if (answer == Core::ANSWER_PREFER_A || answer == Core::ANSWER_PREFER_B) {
        return;
    }
    if (answer != Core::ANSWER_ABOUT_EQUAL) {
        throw std::invalid_argument("Answer must be +1, -1 or 0, got " + std::to_string(answer));
    }
    if (type_ == Core::QueryType::Strict) {
        throw std::invalid_argument("\"About equal\" is not a valid answer to a strict query");
    }
    if (params_.delta == 0.0) {
        throw std::invalid_argument("\"About equal\" answers require a positive delta");
    }
}

double PreferenceModel::log_likelihood_from_projection(double projection, int answer) const {
    if (type_ == Core::QueryType::Strict) {
        if (answer == Core::ANSWER_ABOUT_EQUAL) {
            return NEG_INF;
        }
        double signed_projection = static_cast<double>(answer) * projection;
        if (signed_projection > 0.0) return 0.0;
        if (signed_projection < 0.0) return NEG_INF;
        return std::log(0.5);
    }

    const double z = params_.beta * projection;
    const double d = params_.delta;
    const double log_a = -softplus(d - z);
    const double log_b = -softplus(d + z);

    if (answer == Core::ANSWER_PREFER_A) return log_a;
    if (answer == Core::ANSWER_PREFER_B) return log_b;

    if (d == 0.0) {
        return NEG_INF;
    }
    // log((e^{2d} - 1) / ((1 + e^{d-z})(1 + e^{d+z})))
    return log_expm1(2.0 * d) - softplus(d - z) - softplus(d + z);
}

double PreferenceModel::probability_from_projection(double projection, int answer) const {
    double ll = log_likelihood_from_projection(projection, answer);
    return ll == NEG_INF ? 0.0 : std::exp(ll);
}

double PreferenceModel::log_likelihood(const Core::WeightVector& w,
                                       const std::vector<double>& diff,
                                       int answer) const {
    return log_likelihood_from_projection(Core::dot(w, diff), answer);
}

double PreferenceModel::answer_probability(const Core::WeightVector& w,
                                           const std::vector<double>& diff,
                                           int answer) const {
    return probability_from_projection(Core::dot(w, diff), answer);
}

double PreferenceModel::constraint_log_likelihood(const Core::WeightVector& w,
                                                  const Core::PreferenceConstraint& constraint) const {
    return log_likelihood(w, constraint.delta, constraint.answer);
}

double PreferenceModel::total_log_likelihood(
    const Core::WeightVector& w,
    const std::vector<Core::PreferenceConstraint>& constraints) const {
    double total = 0.0;
    for (const auto& constraint : constraints) {
        total += constraint_log_likelihood(w, constraint);
        if (total == NEG_INF) {
            break;
        }
    }
    return total;
}

} // namespace Model
} // namespace ActivePref
