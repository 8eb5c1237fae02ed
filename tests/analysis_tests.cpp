#include "analysis/constraint_filter.hpp"
#include "analysis/evaluation.hpp"
#include "analysis/linear_program.hpp"
#include "sampling/belief.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

using namespace ActivePref;

namespace {

Core::PreferenceConstraint make_constraint(std::vector<double> delta, int answer) {
    Core::PreferenceConstraint c;
    c.delta = std::move(delta);
    c.answer = answer;
    return c;
}

// Four samples around (1, 0) with equal weights
Sampling::Belief concentrated_belief() {
    return Sampling::Belief({
        {{1.0, 0.0}, 1.0},
        {{0.8, 0.6}, 1.0},
        {{0.8, -0.6}, 1.0},
        {{0.6, 0.8}, 1.0},
    });
}

} // namespace

void test_remove_duplicates() {
    std::cout << "Testing duplicate removal..." << std::endl;

    std::vector<Core::PreferenceConstraint> history = {
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({2.0, 0.0}, Core::ANSWER_PREFER_A),      // Same half-space, scaled
        make_constraint({-1.0, 0.0}, Core::ANSWER_PREFER_B),     // Same half-space, flipped answer
        make_constraint({0.0, 1.0}, Core::ANSWER_PREFER_A),
        make_constraint({0.0, 1.0}, Core::ANSWER_ABOUT_EQUAL),
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_B),      // Opposite half-space
    };

    auto kept = Analysis::ConstraintFilter::remove_duplicates(history, 1e-4);
    assert((kept == std::vector<size_t>{0, 3, 5}));

    std::cout << "  ✓ Duplicate removal tests passed" << std::endl;
}

void test_filter_noise() {
    std::cout << "Testing noise filtering..." << std::endl;

    auto belief = concentrated_belief();
    std::vector<Core::PreferenceConstraint> history = {
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),   // All four samples agree
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_B),   // None agree
        make_constraint({0.0, 1.0}, Core::ANSWER_PREFER_A),   // Two of four agree
        make_constraint({0.0, 1.0}, Core::ANSWER_ABOUT_EQUAL),
    };

    auto kept = Analysis::ConstraintFilter::filter_noise(history, belief, 0.7);
    assert((kept == std::vector<size_t>{0}));

    kept = Analysis::ConstraintFilter::filter_noise(history, belief, 0.4);
    assert((kept == std::vector<size_t>{0, 2}));

    bool threw = false;
    try {
        Analysis::ConstraintFilter::filter_noise(history, Sampling::Belief(), 0.7);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Noise filtering tests passed" << std::endl;
}

void test_filter_epsilon_delta() {
    std::cout << "Testing epsilon-delta filtering..." << std::endl;

    auto belief = concentrated_belief();
    std::vector<Core::PreferenceConstraint> history = {
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),   // Gaps 1.0, 0.8, 0.8, 0.6
        make_constraint({0.5, 0.0}, Core::ANSWER_PREFER_A),   // Gaps 0.5, 0.4, 0.4, 0.3
    };

    auto kept = Analysis::ConstraintFilter::filter_epsilon_delta(history, belief, 0.5, 0.05);
    assert((kept == std::vector<size_t>{0}));

    kept = Analysis::ConstraintFilter::filter_epsilon_delta(history, belief, 0.0, 0.05);
    assert((kept == std::vector<size_t>{0, 1}));

    // Allowing one sample in four to miss the gap keeps the larger query at 0.7
    kept = Analysis::ConstraintFilter::filter_epsilon_delta(history, belief, 0.7, 0.3);
    assert((kept == std::vector<size_t>{0}));

    bool threw = false;
    try {
        Analysis::ConstraintFilter::filter_epsilon_delta(history, belief, 0.0, 1.5);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Epsilon-delta filtering tests passed" << std::endl;
}

void test_linear_program() {
    std::cout << "Testing linear program..." << std::endl;

    // Unconstrained direction stops at the box
    Analysis::LinearProgram box({1.0, -2.0});
    box.add_constraint({1.0, 0.0}, 1.0);
    box.add_constraint({-1.0, 0.0}, 1.0);
    box.add_constraint({0.0, 1.0}, 1.0);
    box.add_constraint({0.0, -1.0}, 1.0);
    auto result = box.minimize();
    assert(result.bounded);
    assert(std::abs(result.objective + 3.0) < 1e-12);
    assert(std::abs(result.x[0] + 1.0) < 1e-12);
    assert(std::abs(result.x[1] - 1.0) < 1e-12);

    // Homogeneous cone x0 >= 0 keeps the origin optimal for min x0
    Analysis::LinearProgram cone({1.0, 0.0});
    cone.add_constraint({-1.0, 0.0}, 0.0);
    cone.add_constraint({0.0, 1.0}, 1.0);
    cone.add_constraint({0.0, -1.0}, 1.0);
    result = cone.minimize();
    assert(result.bounded);
    assert(std::abs(result.objective) < 1e-12);

    Analysis::LinearProgram open({0.0, 1.0});
    open.add_constraint({1.0, 0.0}, 1.0);
    result = open.minimize();
    assert(!result.bounded);
    assert(std::isinf(result.objective) && result.objective < 0.0);

    bool threw = false;
    try {
        open.add_constraint({1.0}, 1.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        open.add_constraint({1.0, 1.0}, -0.5);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Linear program tests passed" << std::endl;
}

void test_remove_redundant() {
    std::cout << "Testing redundancy removal..." << std::endl;

    // w0 >= 0 and w1 >= 0 imply w0 + w1 >= 0
    std::vector<Core::PreferenceConstraint> implied = {
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({0.0, 2.0}, Core::ANSWER_PREFER_A),
        make_constraint({1.0, 1.0}, Core::ANSWER_PREFER_A),
    };
    assert((Analysis::ConstraintFilter::remove_redundant(implied) == std::vector<size_t>{0, 1}));

    // Same half-spaces in the other order drop the sum first
    std::vector<Core::PreferenceConstraint> reordered = {
        make_constraint({1.0, 1.0}, Core::ANSWER_PREFER_A),
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({0.0, 2.0}, Core::ANSWER_PREFER_A),
    };
    assert((Analysis::ConstraintFilter::remove_redundant(reordered) == std::vector<size_t>{1, 2}));

    // Nearby but distinct normals both cut the cone
    std::vector<Core::PreferenceConstraint> distinct = {
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({1.0, 0.1}, Core::ANSWER_PREFER_A),
    };
    assert((Analysis::ConstraintFilter::remove_redundant(distinct) == std::vector<size_t>{0, 1}));

    // Equivalent answers keep the later one; about-equal answers define nothing
    std::vector<Core::PreferenceConstraint> repeated = {
        make_constraint({2.0, 0.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({0.0, 1.0, 0.0}, Core::ANSWER_ABOUT_EQUAL),
        make_constraint({-1.0, 0.0, 0.0}, Core::ANSWER_PREFER_B),
        make_constraint({0.0, 0.0, 1.0}, Core::ANSWER_PREFER_B),
    };
    assert((Analysis::ConstraintFilter::remove_redundant(repeated) == std::vector<size_t>{2, 3}));

    assert(Analysis::ConstraintFilter::remove_redundant({}).empty());

    std::cout << "  ✓ Redundancy removal tests passed" << std::endl;
}

void test_filter_pipeline() {
    std::cout << "Testing filter pipeline..." << std::endl;

    auto belief = concentrated_belief();
    std::vector<Core::PreferenceConstraint> history = {
        make_constraint({0.0, 1.0}, Core::ANSWER_ABOUT_EQUAL),
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({3.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_B),
        make_constraint({0.2, 0.1}, Core::ANSWER_PREFER_A),
    };

    Analysis::FilterOptions options;
    options.epsilon = 0.5;
    auto report = Analysis::ConstraintFilter::run(history, belief, options);
    assert(report.input == 5);
    assert(report.half_spaces == 4);
    assert(report.after_duplicates == 3);
    assert(report.after_noise == 2);
    assert(report.after_epsilon == 1);
    assert(report.after_redundancy == 1);
    assert((report.kept == std::vector<size_t>{1}));

    // Every stage disabled leaves the half-spaces
    options.skip_remove_duplicates = true;
    options.skip_noise_filtering = true;
    options.skip_epsilon_filtering = true;
    options.skip_redundancy_filtering = true;
    report = Analysis::ConstraintFilter::run(history, belief, options);
    assert(report.after_redundancy == 4);
    assert((report.kept == std::vector<size_t>{1, 2, 3, 4}));

    // Redundancy alone: answer 1 is implied by answer 2
    options.skip_redundancy_filtering = false;
    report = Analysis::ConstraintFilter::run(history, belief, options);
    assert(report.after_epsilon == 4);
    assert(report.after_redundancy == 3);
    assert((report.kept == std::vector<size_t>{2, 3, 4}));

    std::cout << "  ✓ Filter pipeline tests passed" << std::endl;
}

void test_pass_rate() {
    std::cout << "Testing pass rate..." << std::endl;

    Core::WeightVector truth = {0.6, 0.8};
    std::vector<Core::PreferenceConstraint> tests = {
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({0.0, -1.0}, Core::ANSWER_PREFER_B),
        make_constraint({1.0, 1.0}, Core::ANSWER_ABOUT_EQUAL),
    };

    assert(Analysis::Evaluation::pass_rate(truth, tests, 0.0, 50, 1) == 1.0);

    tests.push_back(make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_B));
    assert(Analysis::Evaluation::pass_rate(truth, tests, 0.0, 50, 1) == 0.0);
    tests.pop_back();

    // Noise lowers the rate and the same seed reproduces it
    double noisy = Analysis::Evaluation::pass_rate(truth, tests, 1.0, 500, 3);
    assert(noisy < 1.0 && noisy > 0.0);
    assert(noisy == Analysis::Evaluation::pass_rate(truth, tests, 1.0, 500, 3));

    bool threw = false;
    try {
        Analysis::Evaluation::pass_rate(truth, tests, -1.0, 10, 1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Analysis::Evaluation::pass_rate({1.0, 0.0, 0.0}, tests, 0.0, 10, 1);
    } catch (const Core::DimensionMismatchError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Pass rate tests passed" << std::endl;
}

void test_alignment_and_agreement() {
    std::cout << "Testing alignment and agreement..." << std::endl;

    assert(std::fabs(Analysis::Evaluation::alignment({2.0, 0.0}, {1.0, 0.0}) - 1.0) < 1e-12);
    assert(std::fabs(Analysis::Evaluation::alignment({0.0, 1.0}, {1.0, 0.0})) < 1e-12);
    assert(std::fabs(Analysis::Evaluation::alignment({-1.0, 0.0}, {1.0, 0.0}) + 1.0) < 1e-12);

    std::vector<Core::PreferenceConstraint> history = {
        make_constraint({1.0, 0.0}, Core::ANSWER_PREFER_A),
        make_constraint({0.0, 1.0}, Core::ANSWER_PREFER_A),
        make_constraint({0.0, 1.0}, Core::ANSWER_ABOUT_EQUAL),
    };
    assert(Analysis::Evaluation::agreement({1.0, -0.5}, history) == 0.5);
    assert(Analysis::Evaluation::agreement({1.0, 0.5}, history) == 1.0);
    assert(Analysis::Evaluation::agreement({1.0, 0.5}, {}) == 1.0);

    std::cout << "  ✓ Alignment and agreement tests passed" << std::endl;
}

int main() {
    std::cout << "\n=== Running Analysis Tests ===\n" << std::endl;

    test_remove_duplicates();
    test_filter_noise();
    test_filter_epsilon_delta();
    test_linear_program();
    test_remove_redundant();
    test_filter_pipeline();
    test_pass_rate();
    test_alignment_and_agreement();

    std::cout << "\n=== All Tests Passed ===\n" << std::endl;

    return 0;
}
