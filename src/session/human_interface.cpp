#include "session/human_interface.hpp"
#include "utils/logger.hpp"
#include <random>
#include <stdexcept>
#include <utility>

namespace ActivePref {
namespace Session {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

// ConsoleHuman

ConsoleHuman::ConsoleHuman(std::istream& in, std::ostream& out, bool allow_about_equal,
                           PlaybackHook playback, const InterruptFlag* interrupt)
    : in_(in), out_(out), allow_about_equal_(allow_about_equal),
      playback_(std::move(playback)), interrupt_(interrupt) {}

void ConsoleHuman::show(const Core::Trajectory& trajectory) {
    if (playback_) {
        playback_(trajectory);
        return;
    }
    out_ << "  " << trajectory.id << " features " << Core::format_vector(trajectory.features) << "\n";
}

Response ConsoleHuman::ask(const Core::Query& query) {
    const bool weak = query.type == Core::QueryType::Weak && allow_about_equal_;

    out_ << "\nQuery " << (query.index + 1) << ": A = " << query.pair.a.id
         << ", B = " << query.pair.b.id << "\n";

    Response response;
    while (true) {
        out_ << "A/B to watch, 1/2 to vote";
        if (weak) {
            out_ << ", 0 for \"About Equal\"";
        }
        out_ << ", q to quit: " << std::flush;

        std::string line;
        if (!std::getline(in_, line) || (interrupt_ && interrupt_->requested())) {
            response.interrupted = true;
            return response;
        }

        std::string choice = trim(line);
        if (choice == "A" || choice == "a") {
            show(query.pair.a);
        } else if (choice == "B" || choice == "b") {
            show(query.pair.b);
        } else if (choice == "1") {
            response.answer = Core::ANSWER_PREFER_A;
            return response;
        } else if (choice == "2") {
            response.answer = Core::ANSWER_PREFER_B;
            return response;
        } else if (choice == "0" && weak) {
            response.answer = Core::ANSWER_ABOUT_EQUAL;
            return response;
        } else if (choice == "q" || choice == "Q") {
            response.interrupted = true;
            return response;
        } else {
            out_ << "Invalid input: " << choice << "\n";
        }
    }
}

// SimulatedHuman

SimulatedHuman::SimulatedHuman(Core::WeightVector true_reward, Model::PreferenceModel model,
                               std::optional<uint64_t> seed)
    : true_reward_(Core::normalized(true_reward)), model_(std::move(model)), seed_(seed),
      fixed_seed_(seed.has_value()), answers_given_(0) {}

void SimulatedHuman::on_session_start(uint64_t session_seed) {
    if (!fixed_seed_) {
        seed_ = Core::derive_seed(session_seed, SEED_STREAM);
    }
}

Response SimulatedHuman::ask(const Core::Query& query) {
    const std::vector<double> diff = query.pair.difference();
    if (diff.size() != true_reward_.size()) {
        throw Core::DimensionMismatchError("Query does not match simulated reward", true_reward_.size(),
                                           diff.size());
    }
    const double projection = Core::dot(true_reward_, diff);

    Response response;
    if (model_.type() == Core::QueryType::Strict) {
        response.answer = projection > 0.0 ? Core::ANSWER_PREFER_A : Core::ANSWER_PREFER_B;
    } else {
        if (!seed_) {
            throw std::logic_error("Simulated human has no seed; it must join a session first");
        }
        std::mt19937_64 rng(Core::derive_seed(*seed_, query.index));
        std::uniform_real_distribution<double> uniform(0.0, 1.0);
        const double u = uniform(rng);
        const double p_a = model_.probability_from_projection(projection, Core::ANSWER_PREFER_A);
        const double p_b = model_.probability_from_projection(projection, Core::ANSWER_PREFER_B);
        if (u < p_a) {
            response.answer = Core::ANSWER_PREFER_A;
        } else if (u < p_a + p_b || model_.params().delta == 0.0) {
            response.answer = Core::ANSWER_PREFER_B;
        } else {
            response.answer = Core::ANSWER_ABOUT_EQUAL;
        }
    }

    ++answers_given_;
    LOG_DEBUG("HUMAN", "Simulated answer " + std::to_string(response.answer) + " to query " +
                       std::to_string(query.index));
    return response;
}

} // namespace Session
} // namespace ActivePref
