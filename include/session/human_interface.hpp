#pragma once

#include "core/types.hpp"
#include "model/preference_model.hpp"
#include "session/interrupt_flag.hpp"
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace ActivePref {
namespace Session {

struct Response {
    bool interrupted = false;
    int answer = Core::ANSWER_PREFER_A;
};

// Whoever answers queries. The session never renders trajectories itself.
class HumanInterface {
public:
    virtual ~HumanInterface() = default;

    virtual std::string name() const = 0;
    virtual Response ask(const Core::Query& query) = 0;

    // Called once the session seed is known, fresh or resumed
    virtual void on_session_start(uint64_t session_seed) { (void)session_seed; }
};

/**
 * Interactive prompt on a pair of streams
 *
 * "A"/"B" replay a trajectory through the playback hook, "1"/"2" vote,
 * "0" answers "About Equal" on weak queries, "q" quits. End of input or an
 * interrupt counts as quitting.
 */
class ConsoleHuman : public HumanInterface {
public:
    using PlaybackHook = std::function<void(const Core::Trajectory&)>;

    ConsoleHuman(std::istream& in, std::ostream& out,
                 bool allow_about_equal = false,
                 PlaybackHook playback = nullptr,
                 const InterruptFlag* interrupt = &InterruptFlag::instance());

    std::string name() const override { return "console"; }
    Response ask(const Core::Query& query) override;

private:
    void show(const Core::Trajectory& trajectory);

    std::istream& in_;
    std::ostream& out_;
    bool allow_about_equal_;
    PlaybackHook playback_;
    const InterruptFlag* interrupt_;
};

/**
 * Answers from a known reward vector
 *
 * Strict queries are answered by the sign of w* . diff. Weak queries draw
 * from the weak answer model, one stream per query index. Without an explicit
 * seed the stream is derived from the session seed, so a resumed session
 * hears the same answers as the run it continues.
 */
class SimulatedHuman : public HumanInterface {
public:
    // Stream index under the session seed
    static constexpr uint64_t SEED_STREAM = 3;

    SimulatedHuman(Core::WeightVector true_reward, Model::PreferenceModel model,
                   std::optional<uint64_t> seed = std::nullopt);

    std::string name() const override { return "simulated"; }
    Response ask(const Core::Query& query) override;
    void on_session_start(uint64_t session_seed) override;

    const Core::WeightVector& true_reward() const { return true_reward_; }
    size_t answers_given() const { return answers_given_; }

private:
    Core::WeightVector true_reward_;
    Model::PreferenceModel model_;
    std::optional<uint64_t> seed_;
    bool fixed_seed_;
    size_t answers_given_;
};

} // namespace Session
} // namespace ActivePref
