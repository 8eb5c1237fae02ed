#include "session/session_loop.hpp"
#include <random>
#include <stdexcept>
#include <utility>

namespace ActivePref {
namespace Session {

namespace {

// Independent random streams under the session seed
constexpr uint64_t SAMPLER_STREAM = 1;
constexpr uint64_t ACQUISITION_STREAM = 2;

uint64_t random_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | static_cast<uint64_t>(rd());
}

} // namespace

std::string to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Init: return "init";
        case SessionPhase::AwaitingAnswer: return "awaiting_answer";
        case SessionPhase::UpdatingBelief: return "updating_belief";
        case SessionPhase::Done: return "done";
        case SessionPhase::SaveAndExit: return "save_and_exit";
    }
    return "unknown";
}

SessionLoop::SessionLoop(SessionOptions options,
                         Acquisition::CandidateSource& source,
                         HumanInterface& human)
    : options_(std::move(options)),
      source_(source),
      human_(human),
      interrupt_(options_.interrupt ? options_.interrupt : &InterruptFlag::instance()),
      phase_(SessionPhase::Init),
      interrupt_saved_(false),
      logger_("SESSION") {
    if (options_.num_samples == 0) {
        throw std::invalid_argument("Session needs at least one posterior sample");
    }
    options_.stop.validate();
    options_.sampler.validate();
}

void SessionLoop::resume(SessionState state) {
    if (phase_ != SessionPhase::Init) {
        throw std::logic_error("Cannot resume a session that has already run");
    }
    state.validate();
    resumed_ = std::move(state);
}

bool SessionLoop::interrupt_requested() const {
    return interrupt_->requested();
}

uint64_t SessionLoop::sampler_seed(size_t num_constraints) const {
    return Core::derive_seed(Core::derive_seed(state_.seed, SAMPLER_STREAM), num_constraints);
}

void SessionLoop::init() {
    if (resumed_) {
        init_resumed();
    } else {
        init_fresh();
    }

    model_ = std::make_unique<Model::PreferenceModel>(state_.query_type, state_.model_params);
    sampler_ = std::make_unique<Sampling::PosteriorSampler>(options_.sampler);
    engine_ = std::make_unique<Acquisition::AcquisitionEngine>(
        state_.criterion, *model_, Core::derive_seed(state_.seed, ACQUISITION_STREAM));

    Acquisition::StopConfig stop;
    stop.epsilon = state_.epsilon;
    stop.max_queries = state_.max_queries;
    stopping_rule_ = std::make_unique<Acquisition::StoppingRule>(stop, state_.criterion);
    human_.on_session_start(state_.seed);

    if (state_.belief.empty()) {
        // Replay the history so the belief matches an uninterrupted run
        state_.belief = sampler_->sample_prior(state_.dimension, state_.num_samples, sampler_seed(0));
        std::vector<Core::PreferenceConstraint> prefix;
        for (const auto& constraint : state_.constraints) {
            prefix.push_back(constraint);
            Sampling::Belief next = sampler_->sample(prefix, *model_, state_.dimension, state_.num_samples,
                                                     sampler_seed(prefix.size()), &state_.belief);
            state_.belief = std::move(next);
        }
    }

    logger_.info("Session '" + state_.task + "': " + Core::to_string(state_.criterion) + " acquisition, " +
                 Core::to_string(state_.query_type) + " queries, D=" + std::to_string(state_.dimension) +
                 ", M=" + std::to_string(state_.num_samples) + ", candidates from " + source_.name() +
                 ", answers from " + human_.name());
}

void SessionLoop::init_fresh() {
    const size_t dimension = source_.dimension();
    const size_t expected = Core::task_dimension(options_.task);
    if (expected != 0 && expected != dimension) {
        throw Core::DimensionMismatchError("Candidate features do not match task '" + options_.task + "'",
                                           expected, dimension);
    }

    state_ = SessionState();
    state_.task = options_.task;
    state_.dimension = dimension;
    state_.query_type = options_.query_type;
    state_.criterion = options_.criterion;
    state_.model_params = options_.model_params;
    state_.epsilon = options_.stop.epsilon;
    state_.max_queries = options_.stop.max_queries;
    state_.num_samples = options_.num_samples;
    if (options_.seed) {
        state_.seed = *options_.seed;
        state_.reproducible = true;
    } else {
        state_.seed = random_seed();
        state_.reproducible = false;
        logger_.warning("No seed configured, drew " + std::to_string(state_.seed) +
                        " from std::random_device");
    }
    state_.status = SessionStatus::InProgress;
}

void SessionLoop::check_resumed_state() const {
    const SessionState& saved = *resumed_;
    if (saved.dimension != source_.dimension()) {
        throw Core::DimensionMismatchError("Saved session does not match candidate features",
                                           saved.dimension, source_.dimension());
    }
    if (saved.query_type != options_.query_type) {
        throw Core::SessionStateError("Saved session uses " + Core::to_string(saved.query_type) +
                                      " queries, configuration asks for " +
                                      Core::to_string(options_.query_type));
    }
    if (saved.model_params.delta != options_.model_params.delta ||
        saved.model_params.beta != options_.model_params.beta) {
        throw Core::SessionStateError("Saved session was recorded under different answer model parameters");
    }
}

void SessionLoop::init_resumed() {
    check_resumed_state();

    state_ = std::move(*resumed_);
    resumed_.reset();

    if (state_.criterion != options_.criterion) {
        logger_.warning("Keeping saved criterion " + Core::to_string(state_.criterion) + " (configured " +
                        Core::to_string(options_.criterion) + ")");
    }
    if (state_.num_samples != options_.num_samples) {
        logger_.warning("Keeping saved sample count " + std::to_string(state_.num_samples) +
                        " (configured " + std::to_string(options_.num_samples) + ")");
    }
    if (!state_.reproducible) {
        logger_.info("Saved session used a random seed; continuing with the recorded value");
    }

    // Stopping settings may be changed between runs
    state_.epsilon = options_.stop.epsilon;
    state_.max_queries = options_.stop.max_queries;
    state_.status = SessionStatus::InProgress;

    logger_.info("Resuming after " + std::to_string(state_.constraints.size()) + " constraints");
}

void SessionLoop::update_belief() {
    const size_t n = state_.constraints.size();
    Utils::ScopedTimer timer(logger_, "Belief update");

    try {
        Sampling::Belief next = sampler_->sample(state_.constraints, *model_, state_.dimension,
                                                 state_.num_samples, sampler_seed(n), &state_.belief);
        state_.belief = std::move(next);
    } catch (const Core::DegenerateChainError& e) {
        logger_.error(std::string("Posterior update failed: ") + e.what());
        // Keep the last consistent state on disk
        state_.constraints.pop_back();
        state_.queries_asked = state_.constraints.size();
        save(SessionStatus::Interrupted);
        interrupt_saved_ = true;
        throw;
    }

    Core::WeightVector estimate = state_.belief.mean_direction();
    logger_.info("w after " + std::to_string(n) + " queries: " + Core::format_vector(estimate) +
                 " (acceptance " + std::to_string(sampler_->last_stats().acceptance_rate()) + ", " +
                 std::to_string(timer.elapsed_ms()) + " ms)");

    if (options_.observer) {
        options_.observer(estimate, state_.queries_asked);
    }
}

void SessionLoop::save(SessionStatus status) {
    state_.status = status;
    if (options_.state_path.empty()) {
        logger_.debug("No state path configured, session not persisted");
        return;
    }
    state_.save(options_.state_path);
}

SessionOutcome SessionLoop::run() {
    if (phase_ != SessionPhase::Init) {
        throw std::logic_error("Session loop has already run");
    }

    init();

    SessionOutcome outcome;
    while (true) {
        if (interrupt_requested()) {
            phase_ = SessionPhase::SaveAndExit;
            break;
        }

        phase_ = SessionPhase::AwaitingAnswer;
        const size_t index = state_.constraints.size();

        Acquisition::AcquisitionResult result;
        double score = 0.0;
        {
            Utils::ScopedTimer timer(logger_, "Query selection");
            result = engine_->next_query(state_.belief, source_, index);
            score = result.score;
            if (state_.criterion == Core::Criterion::Random) {
                score = engine_->best_volume_removal(state_.belief, source_, index);
            }
        }
        state_.last_score = score;

        // Selection can take long; a Ctrl-C during it must not show the query
        if (interrupt_requested()) {
            phase_ = SessionPhase::SaveAndExit;
            break;
        }

        Acquisition::StopDecision decision = stopping_rule_->evaluate(score, state_.queries_asked);
        if (decision.should_stop) {
            outcome.stop_reason = decision.reason;
            logger_.info("Stopping after " + std::to_string(state_.queries_asked) + " queries (" +
                         Acquisition::to_string(decision.reason) + ", score " + std::to_string(score) + ")");
            phase_ = SessionPhase::Done;
            break;
        }

        Response response = human_.ask(result.query);
        if (response.interrupted || interrupt_requested()) {
            phase_ = SessionPhase::SaveAndExit;
            break;
        }
        model_->validate_answer(response.answer);

        phase_ = SessionPhase::UpdatingBelief;
        Core::PreferenceConstraint constraint;
        constraint.delta = result.query.pair.difference();
        constraint.answer = response.answer;
        constraint.a_id = result.query.pair.a.id;
        constraint.b_id = result.query.pair.b.id;
        state_.constraints.push_back(std::move(constraint));
        state_.queries_asked = state_.constraints.size();

        update_belief();
    }

    if (phase_ == SessionPhase::Done) {
        save(SessionStatus::Completed);
    } else if (!interrupt_saved_) {
        logger_.warning("Interrupted after " + std::to_string(state_.queries_asked) + " queries, saving");
        save(SessionStatus::Interrupted);
        interrupt_saved_ = true;
    }

    outcome.phase = phase_;
    outcome.queries_asked = state_.queries_asked;
    outcome.final_score = state_.last_score;
    outcome.interrupted = phase_ == SessionPhase::SaveAndExit;
    outcome.state_path = options_.state_path;
    outcome.estimate = state_.belief.mean_direction();
    return outcome;
}

} // namespace Session
} // namespace ActivePref
