#pragma once

#include "acquisition/acquisition_engine.hpp"
#include "acquisition/candidate_source.hpp"
#include "acquisition/stopping_rule.hpp"
#include "core/types.hpp"
#include "model/preference_model.hpp"
#include "sampling/posterior_sampler.hpp"
#include "session/human_interface.hpp"
#include "session/interrupt_flag.hpp"
#include "session/session_state.hpp"
#include "utils/logger.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ActivePref {
namespace Session {

enum class SessionPhase {
    Init,
    AwaitingAnswer,
    UpdatingBelief,
    Done,
    SaveAndExit
};

std::string to_string(SessionPhase phase);

struct SessionOptions {
    std::string task = "driver";
    Core::QueryType query_type = Core::QueryType::Strict;
    Core::Criterion criterion = Core::Criterion::Information;
    Model::PreferenceModelParams model_params;
    Acquisition::StopConfig stop;
    size_t num_samples = 100;
    std::optional<uint64_t> seed;              // Drawn from std::random_device when absent
    Sampling::SamplerConfig sampler;
    std::string state_path;                    // Where to persist; empty disables saving
    InterruptFlag* interrupt = nullptr;        // Process-wide flag when null

    // Called after every belief update with the mean weight direction
    std::function<void(const Core::WeightVector& estimate, size_t queries_asked)> observer;
};

struct SessionOutcome {
    SessionPhase phase = SessionPhase::Init;
    size_t queries_asked = 0;
    Acquisition::StopReason stop_reason = Acquisition::StopReason::Continue;
    double final_score = 0.0;
    bool interrupted = false;
    std::string state_path;
    Core::WeightVector estimate;
};

/**
 * Drives one preference elicitation session.
 *
 *   Init -> AwaitingAnswer -> UpdatingBelief -> (Done | AwaitingAnswer)
 *
 * An interrupt in any phase moves to SaveAndExit, which persists the state
 * once with status "interrupted". Every random stream is derived from the
 * session seed and the number of recorded constraints, so a resumed session
 * follows the same path as one that was never interrupted.
 */
class SessionLoop {
public:
    SessionLoop(SessionOptions options,
                Acquisition::CandidateSource& source,
                HumanInterface& human);

    // Continue from a saved state instead of starting fresh
    void resume(SessionState state);

    SessionOutcome run();

    SessionPhase phase() const { return phase_; }
    const SessionState& state() const { return state_; }
    const Acquisition::AcquisitionEngine* engine() const { return engine_.get(); }

private:
    void init();
    void init_fresh();
    void init_resumed();
    void check_resumed_state() const;

    void update_belief();
    void save(SessionStatus status);
    bool interrupt_requested() const;

    uint64_t sampler_seed(size_t num_constraints) const;

    SessionOptions options_;
    Acquisition::CandidateSource& source_;
    HumanInterface& human_;
    InterruptFlag* interrupt_;

    std::optional<SessionState> resumed_;
    SessionState state_;
    SessionPhase phase_;
    bool interrupt_saved_;

    std::unique_ptr<Model::PreferenceModel> model_;
    std::unique_ptr<Sampling::PosteriorSampler> sampler_;
    std::unique_ptr<Acquisition::AcquisitionEngine> engine_;
    std::unique_ptr<Acquisition::StoppingRule> stopping_rule_;

    Utils::ModuleLogger logger_;
};

} // namespace Session
} // namespace ActivePref
