#include "acquisition/acquisition_engine.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace ActivePref {
namespace Acquisition {

namespace {

// -p log p with 0 log 0 = 0
double entropy_term(double p) {
    return p > 0.0 ? -p * std::log(p) : 0.0;
}

} // namespace

AcquisitionEngine::AcquisitionEngine(Core::Criterion criterion,
                                     const Model::PreferenceModel& model,
                                     uint64_t seed)
    : criterion_(criterion), model_(model), seed_(seed), queries_selected_(0), logger_("ACQUIRE") {}

void AcquisitionEngine::answer_statistics(const Sampling::Belief& belief,
                                          const std::vector<double>& diff,
                                          std::vector<double>& mean_probabilities,
                                          double& mean_entropy) const {
    const auto& answers = model_.answers();
    const std::vector<double> weights = belief.normalized_weights();

    mean_probabilities.assign(answers.size(), 0.0);
    mean_entropy = 0.0;

    for (size_t m = 0; m < belief.size(); ++m) {
        const double projection = Core::dot(belief[m].w, diff);
        double entropy = 0.0;
        for (size_t s = 0; s < answers.size(); ++s) {
            const double p = model_.probability_from_projection(projection, answers[s]);
            mean_probabilities[s] += weights[m] * p;
            entropy += entropy_term(p);
        }
        mean_entropy += weights[m] * entropy;
    }
}

double AcquisitionEngine::information_gain(const Sampling::Belief& belief,
                                           const std::vector<double>& diff) const {
    if (belief.empty()) {
        throw std::invalid_argument("Cannot score a query against an empty belief");
    }
    if (diff.size() != belief.dimension()) {
        throw Core::DimensionMismatchError("Query dimension does not match belief",
                                           belief.dimension(), diff.size());
    }

    std::vector<double> mean_probabilities;
    double mean_entropy = 0.0;
    answer_statistics(belief, diff, mean_probabilities, mean_entropy);

    double marginal_entropy = 0.0;
    for (double p : mean_probabilities) {
        marginal_entropy += entropy_term(p);
    }
    return std::max(0.0, marginal_entropy - mean_entropy);
}

double AcquisitionEngine::volume_removal(const Sampling::Belief& belief,
                                         const std::vector<double>& diff) const {
    if (belief.empty()) {
        throw std::invalid_argument("Cannot score a query against an empty belief");
    }
    if (diff.size() != belief.dimension()) {
        throw Core::DimensionMismatchError("Query dimension does not match belief",
                                           belief.dimension(), diff.size());
    }

    std::vector<double> mean_probabilities;
    double mean_entropy = 0.0;
    answer_statistics(belief, diff, mean_probabilities, mean_entropy);

    // 1 - p(s) as the mass of the other answers, exactly 0 when every sample agrees
    double removed = 0.0;
    for (size_t s = 0; s < mean_probabilities.size(); ++s) {
        double others = 0.0;
        for (size_t t = 0; t < mean_probabilities.size(); ++t) {
            if (t != s) {
                others += mean_probabilities[t];
            }
        }
        removed += mean_probabilities[s] * others;
    }
    return std::max(0.0, removed);
}

double AcquisitionEngine::score(const Sampling::Belief& belief, const std::vector<double>& diff) const {
    switch (criterion_) {
        case Core::Criterion::Information:
            return information_gain(belief, diff);
        case Core::Criterion::Volume:
            return volume_removal(belief, diff);
        case Core::Criterion::Random:
            return 0.0;
    }
    return 0.0;
}

AcquisitionResult AcquisitionEngine::next_query(const Sampling::Belief& belief,
                                                CandidateSource& source,
                                                size_t query_index) {
    if (belief.empty()) {
        throw std::invalid_argument("Acquisition needs a non-empty belief");
    }
    if (source.dimension() != belief.dimension()) {
        throw Core::DimensionMismatchError("Candidate source dimension does not match belief",
                                           belief.dimension(), source.dimension());
    }

    AcquisitionResult result;
    result.query.type = model_.type();
    result.query.index = query_index;

    const uint64_t stream_seed = Core::derive_seed(seed_, query_index);

    if (criterion_ == Core::Criterion::Random) {
        result.query.pair = source.random_pair(stream_seed);
        result.score = 0.0;
        logger_.debug("Random pick for query " + std::to_string(query_index) + " from " +
                      std::to_string(belief.size()) + " samples");
    } else {
        ScoreFn fn = [this, &belief](const std::vector<double>& diff) {
            return score(belief, diff);
        };
        ScoredPair best = source.best_pair(fn, stream_seed);
        result.query.pair = std::move(best.pair);
        result.score = best.score;
        logger_.debug("Query " + std::to_string(query_index) + ": (" + result.query.pair.a.id + ", " +
                      result.query.pair.b.id + ") " + Core::to_string(criterion_) + " score " +
                      std::to_string(result.score));
    }

    ++queries_selected_;
    return result;
}

double AcquisitionEngine::best_volume_removal(const Sampling::Belief& belief,
                                              CandidateSource& source,
                                              size_t query_index) const {
    if (belief.empty()) {
        throw std::invalid_argument("Cannot score candidates against an empty belief");
    }
    ScoreFn fn = [this, &belief](const std::vector<double>& diff) {
        return volume_removal(belief, diff);
    };
    // Separate stream from the selection draw of the same query
    const uint64_t stream_seed = Core::derive_seed(Core::derive_seed(seed_, query_index), 1);
    return source.best_pair(fn, stream_seed).score;
}

} // namespace Acquisition
} // namespace ActivePref
