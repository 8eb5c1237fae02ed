#include "acquisition/acquisition_engine.hpp"
#include "acquisition/candidate_source.hpp"
#include "acquisition/feature_store.hpp"
#include "data/trajectory_database.hpp"
#include "model/preference_model.hpp"
#include "sampling/posterior_sampler.hpp"
#include "core/types.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

using namespace ActivePref;

namespace {

Core::Trajectory make_trajectory(const std::string& id, std::vector<double> features) {
    Core::Trajectory t;
    t.id = id;
    t.features = std::move(features);
    return t;
}

// Belief of identical unit vectors
Sampling::Belief point_belief(const Core::WeightVector& w, size_t count) {
    std::vector<Sampling::WeightedSample> samples(count, Sampling::WeightedSample{w, 1.0});
    return Sampling::Belief(samples);
}

// Features are the controls themselves
class IdentityFeatureModel : public Acquisition::ControlFeatureModel {
public:
    size_t dimension() const override { return 2; }
    size_t control_dimension() const override { return 2; }
    std::vector<double> lower_bounds() const override { return {-1.0, -1.0}; }
    std::vector<double> upper_bounds() const override { return {1.0, 1.0}; }
    std::vector<double> features(const std::vector<double>& controls) const override { return controls; }
};

} // namespace

void test_information_gain_non_negative() {
    std::cout << "Testing information gain is non-negative..." << std::endl;

    Sampling::PosteriorSampler sampler;
    auto belief = sampler.sample_prior(4, 80, 17);

    Model::PreferenceModelParams params;
    params.delta = 0.4;
    Model::PreferenceModel strict(Core::QueryType::Strict);
    Model::PreferenceModel weak(Core::QueryType::Weak, params);
    Acquisition::AcquisitionEngine strict_engine(Core::Criterion::Information, strict, 1);
    Acquisition::AcquisitionEngine weak_engine(Core::Criterion::Information, weak, 1);

    std::mt19937_64 rng(5);
    std::normal_distribution<double> gauss(0.0, 2.0);
    for (int i = 0; i < 200; ++i) {
        std::vector<double> diff(4);
        for (double& x : diff) {
            x = gauss(rng);
        }
        assert(strict_engine.information_gain(belief, diff) >= 0.0);
        assert(weak_engine.information_gain(belief, diff) >= 0.0);
        assert(strict_engine.volume_removal(belief, diff) >= 0.0);
        // Two answers carry at most log 2 nats
        assert(strict_engine.information_gain(belief, diff) <= std::log(2.0) + 1e-12);
    }

    // Zero difference tells nothing
    assert(weak_engine.information_gain(belief, {0.0, 0.0, 0.0, 0.0}) < 1e-12);

    std::cout << "  ✓ Non-negativity tests passed" << std::endl;
}

void test_scores_vanish_when_samples_agree() {
    std::cout << "Testing scores of a settled belief..." << std::endl;

    Model::PreferenceModel strict(Core::QueryType::Strict);
    Acquisition::AcquisitionEngine info(Core::Criterion::Information, strict, 1);
    Acquisition::AcquisitionEngine volume(Core::Criterion::Volume, strict, 1);

    auto belief = point_belief(Core::normalized({1.0, 1.0}), 8);
    std::vector<double> diff = {1.0, -0.5};
    assert(info.information_gain(belief, diff) == 0.0);
    assert(volume.volume_removal(belief, diff) == 0.0);

    // Evenly split belief: maximal uncertainty
    std::vector<Sampling::WeightedSample> split = {{{1.0, 0.0}, 1.0}, {{-1.0, 0.0}, 1.0}};
    Sampling::Belief even(split);
    assert(std::fabs(info.information_gain(even, {1.0, 0.0}) - std::log(2.0)) < 1e-12);
    assert(std::fabs(volume.volume_removal(even, {1.0, 0.0}) - 0.5) < 1e-12);

    // Weights of 1/40 do not sum to exactly 1; agreement must still score 0
    std::vector<Sampling::WeightedSample> agreeing;
    for (size_t m = 0; m < 40; ++m) {
        double angle = 0.02 * static_cast<double>(m);
        agreeing.push_back({{std::cos(angle), std::sin(angle)}, 1.0});
    }
    Sampling::Belief settled(agreeing);
    assert(volume.volume_removal(settled, {1.0, 0.0}) == 0.0);

    std::cout << "  ✓ Settled belief tests passed" << std::endl;
}

void test_best_volume_removal() {
    std::cout << "Testing best volume removal over a source..." << std::endl;

    Model::PreferenceModel strict(Core::QueryType::Strict);
    Acquisition::AcquisitionEngine random(Core::Criterion::Random, strict, 4);

    // Samples agree on the first axis and split on the second
    std::vector<Sampling::WeightedSample> samples = {
        {Core::normalized({1.0, 1.0}), 1.0}, {Core::normalized({1.0, -1.0}), 1.0}};
    Sampling::Belief belief(samples);

    Acquisition::DatabaseCandidateSource settled(2, {
        {make_trajectory("x", {1.0, 0.0}), make_trajectory("o", {0.0, 0.0})}});
    assert(random.best_volume_removal(belief, settled, 0) == 0.0);

    Acquisition::DatabaseCandidateSource open(2, {
        {make_trajectory("x", {1.0, 0.0}), make_trajectory("o", {0.0, 0.0})},
        {make_trajectory("y", {0.0, 1.0}), make_trajectory("o", {0.0, 0.0})}});
    assert(std::fabs(random.best_volume_removal(belief, open, 0) - 0.5) < 1e-12);

    // Selection stays uniform and belief-free
    assert(random.next_query(belief, open, 0).score == 0.0);

    bool threw = false;
    try {
        random.best_volume_removal(Sampling::Belief(), open, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Best volume removal tests passed" << std::endl;
}

void test_best_pair_selection() {
    std::cout << "Testing best pair selection..." << std::endl;

    std::vector<Sampling::WeightedSample> split = {{{1.0, 0.0}, 1.0}, {{-1.0, 0.0}, 1.0}};
    Sampling::Belief belief(split);

    // Pair 1 separates the two samples, the others do not
    std::vector<Core::CandidatePair> pairs = {
        {make_trajectory("t0", {0.0, 1.0}), make_trajectory("t1", {0.0, 0.0})},
        {make_trajectory("t2", {1.0, 0.0}), make_trajectory("t3", {0.0, 0.0})},
        {make_trajectory("t4", {0.0, -2.0}), make_trajectory("t5", {0.0, 0.0})}};
    Acquisition::DatabaseCandidateSource source(2, pairs);

    Model::PreferenceModel strict(Core::QueryType::Strict);
    Acquisition::AcquisitionEngine engine(Core::Criterion::Information, strict, 3);
    auto result = engine.next_query(belief, source, 0);
    assert(result.query.pair.a.id == "t2");
    assert(std::fabs(result.score - std::log(2.0)) < 1e-12);
    assert(result.query.index == 0);
    assert(result.query.type == Core::QueryType::Strict);
    assert(engine.queries_selected() == 1);

    std::cout << "  ✓ Best pair selection tests passed" << std::endl;
}

void test_tie_break_prefers_first() {
    std::cout << "Testing tie break..." << std::endl;

    Sampling::PosteriorSampler sampler;
    auto belief = sampler.sample_prior(3, 50, 8);

    std::vector<Core::CandidatePair> pairs;
    for (int i = 0; i < 64; ++i) {
        pairs.push_back({make_trajectory("a" + std::to_string(i), {1.0, 2.0, 3.0}),
                         make_trajectory("b" + std::to_string(i), {0.5, -1.0, 0.0})});
    }
    Acquisition::DatabaseCandidateSource source(3, pairs);

    Model::PreferenceModel strict(Core::QueryType::Strict);
    for (auto criterion : {Core::Criterion::Information, Core::Criterion::Volume}) {
        Acquisition::AcquisitionEngine engine(criterion, strict, 1);
        auto result = engine.next_query(belief, source, 0);
        assert(result.query.pair.a.id == "a0");
    }

    std::cout << "  ✓ Tie break tests passed" << std::endl;
}

void test_random_selection() {
    std::cout << "Testing random selection..." << std::endl;

    std::vector<Core::CandidatePair> pairs;
    for (int i = 0; i < 5; ++i) {
        pairs.push_back({make_trajectory("a" + std::to_string(i), {static_cast<double>(i), 1.0}),
                         make_trajectory("b" + std::to_string(i), {0.0, 0.0})});
    }
    Acquisition::DatabaseCandidateSource source(2, pairs);
    auto belief = point_belief({1.0, 0.0}, 4);

    Model::PreferenceModel strict(Core::QueryType::Strict);
    Acquisition::AcquisitionEngine first(Core::Criterion::Random, strict, 1234);
    Acquisition::AcquisitionEngine second(Core::Criterion::Random, strict, 1234);

    std::map<std::string, int> counts;
    for (size_t i = 0; i < 5000; ++i) {
        auto a = first.next_query(belief, source, i);
        auto b = second.next_query(belief, source, i);
        assert(a.query.pair.a.id == b.query.pair.a.id);
        assert(a.score == 0.0);
        counts[a.query.pair.a.id]++;
    }

    assert(counts.size() == 5);
    for (const auto& entry : counts) {
        assert(entry.second >= 880 && entry.second <= 1120);
    }

    // Selection only depends on the sample count, not the sample contents
    Acquisition::AcquisitionEngine third(Core::Criterion::Random, strict, 1234);
    auto other_belief = point_belief(Core::normalized({-1.0, 3.0}), 4);
    for (size_t i = 0; i < 50; ++i) {
        Acquisition::AcquisitionEngine reference(Core::Criterion::Random, strict, 1234);
        assert(third.next_query(other_belief, source, i).query.pair.a.id ==
               reference.next_query(belief, source, i).query.pair.a.id);
    }

    std::cout << "  ✓ Random selection tests passed" << std::endl;
}

void test_empty_inputs() {
    std::cout << "Testing empty candidates and belief..." << std::endl;

    Acquisition::DatabaseCandidateSource empty(3, {});
    auto belief = point_belief(Core::normalized({1.0, 1.0, 1.0}), 3);
    Model::PreferenceModel strict(Core::QueryType::Strict);

    for (auto criterion : {Core::Criterion::Information, Core::Criterion::Volume, Core::Criterion::Random}) {
        Acquisition::AcquisitionEngine engine(criterion, strict, 1);
        bool threw = false;
        try {
            engine.next_query(belief, empty, 0);
        } catch (const Core::NoCandidatesError&) {
            threw = true;
        }
        assert(threw);
    }

    std::vector<Core::CandidatePair> pairs = {
        {make_trajectory("x", {1.0, 0.0, 0.0}), make_trajectory("y", {0.0, 1.0, 0.0})}};
    Acquisition::DatabaseCandidateSource source(3, pairs);
    Acquisition::AcquisitionEngine engine(Core::Criterion::Information, strict, 1);
    bool threw = false;
    try {
        engine.next_query(Sampling::Belief(), source, 0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Empty input tests passed" << std::endl;
}

void test_database_source_from_database() {
    std::cout << "Testing candidate source built from a database..." << std::endl;

    Data::TrajectoryDatabase db(2);
    db.add_trajectory(make_trajectory("p", {1.0, 0.0}));
    db.add_trajectory(make_trajectory("q", {0.0, 1.0}));
    db.add_trajectory(make_trajectory("r", {1.0, 1.0}));
    db.build_pairs(100, 0);

    Acquisition::DatabaseCandidateSource source(db);
    assert(source.size() == 3);
    assert(source.dimension() == 2);
    assert(source.candidate_pairs()[0].a.id == "p");
    assert(source.candidate_pairs()[0].b.id == "q");

    std::cout << "  ✓ Database source tests passed" << std::endl;
}

void test_continuous_source() {
    std::cout << "Testing continuous candidate source..." << std::endl;

    auto model = std::make_shared<IdentityFeatureModel>();
    Acquisition::ContinuousSearchConfig config;
    config.restarts = 3;
    Acquisition::ContinuousCandidateSource source(model, config);
    assert(source.dimension() == 2);

    // Best query maximizes the first feature gap
    Acquisition::ScoreFn score = [](const std::vector<double>& diff) { return diff[0]; };
    auto best = source.optimize_for_acquisition(score, 77);
    assert(best.score > 1.99);
    assert(best.pair.a.controls.size() == 2);
    assert(std::fabs(best.pair.a.features[0] - 1.0) < 1e-2);
    assert(std::fabs(best.pair.b.features[0] + 1.0) < 1e-2);
    assert(source.evaluations() > 0);

    // Same seed, same search
    auto again = source.optimize_for_acquisition(score, 77);
    assert(again.pair.a.controls == best.pair.a.controls);

    auto random = source.random_pair(5);
    for (double x : random.a.controls) {
        assert(x >= -1.0 && x <= 1.0);
    }

    // Drives the acquisition engine like any other source
    std::vector<Sampling::WeightedSample> split = {{{1.0, 0.0}, 1.0}, {{-1.0, 0.0}, 1.0}};
    Model::PreferenceModel strict(Core::QueryType::Strict);
    Acquisition::AcquisitionEngine engine(Core::Criterion::Volume, strict, 9);
    auto result = engine.next_query(Sampling::Belief(split), source, 0);
    assert(std::fabs(result.score - 0.5) < 1e-12);

    std::cout << "  ✓ Continuous source tests passed" << std::endl;
}

int main() {
    std::cout << "\n=== Running Acquisition Tests ===\n" << std::endl;

    test_information_gain_non_negative();
    test_scores_vanish_when_samples_agree();
    test_best_volume_removal();
    test_best_pair_selection();
    test_tie_break_prefers_first();
    test_random_selection();
    test_empty_inputs();
    test_database_source_from_database();
    test_continuous_source();

    std::cout << "\n=== All Tests Passed ===\n" << std::endl;

    return 0;
}
