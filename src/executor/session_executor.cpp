#include "executor/session_executor.hpp"
#include "session/interrupt_flag.hpp"
#include "session/session_state.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace ActivePref {
namespace Executor {

namespace {

constexpr size_t DEFAULT_MAX_PAIRS = 100000;
constexpr uint64_t PAIR_SEED = 0;

} // namespace

SessionExecutor::SessionExecutor(const Config::Configuration& config)
    : config_(config), logger_("EXECUTOR"), status_("initialized") {
}

Data::TrajectoryDatabase SessionExecutor::load_database() const {
    const auto& candidates = config_.get_candidates_config();
    const size_t max_pairs = candidates.max_pairs.has_value()
                                 ? static_cast<size_t>(candidates.max_pairs.value())
                                 : DEFAULT_MAX_PAIRS;

    if (candidates.cache_file.has_value() && std::filesystem::exists(candidates.cache_file.value())) {
        Data::TrajectoryDatabase db = Data::TrajectoryDatabase::load_cache(candidates.cache_file.value());
        if (db.num_pairs() == 0) {
            db.build_pairs(max_pairs, PAIR_SEED);
        }
        return db;
    }

    if (!candidates.trajectories_file.has_value()) {
        throw std::runtime_error("Cache file " + candidates.cache_file.value_or("") +
                                 " not found and no trajectories_file configured");
    }

    Data::TrajectoryDatabase db = Data::TrajectoryDatabase::load_csv(candidates.trajectories_file.value(),
                                                                     config_.feature_dimension());
    db.build_pairs(max_pairs, PAIR_SEED);
    if (candidates.cache_file.has_value()) {
        db.save_cache(candidates.cache_file.value());
    }
    return db;
}

std::unique_ptr<Session::HumanInterface> SessionExecutor::make_human(const Model::PreferenceModel& model) const {
    const auto& human = config_.get_human_config();
    if (human.mode == "simulated") {
        if (!human.true_reward.has_value()) {
            throw std::runtime_error("Simulated human requires true_reward");
        }
        // Seeded by the session loop from the recorded session seed
        return std::make_unique<Session::SimulatedHuman>(human.true_reward.value(), model);
    }
    if (human.mode == "console") {
        const bool about_equal = model.type() == Core::QueryType::Weak && model.params().delta > 0.0;
        return std::make_unique<Session::ConsoleHuman>(std::cin, std::cout, about_equal);
    }
    throw std::runtime_error("Invalid human mode: " + human.mode);
}

Session::SessionOutcome SessionExecutor::execute(const std::string& resume_path) {
    logger_.info("=== Starting Preference Session ===");
    status_ = "running";

    try {
        Session::SessionOptions options = config_.session_options();

        std::optional<Session::SessionState> resumed;
        if (!resume_path.empty()) {
            resumed = Session::SessionState::load(resume_path);
            options.state_path = resume_path;
        }

        Data::TrajectoryDatabase database = load_database();
        Acquisition::DatabaseCandidateSource source(database);
        logger_.info("Candidate pairs: " + std::to_string(source.size()));

        Model::PreferenceModel model(options.query_type, options.model_params);
        auto human = make_human(model);

        Session::SessionLoop loop(options, source, *human);
        if (resumed) {
            loop.resume(std::move(*resumed));
        }

        Session::InterruptFlag::install_signal_handler();
        Session::SessionOutcome outcome;
        try {
            outcome = loop.run();
        } catch (...) {
            Session::InterruptFlag::restore_signal_handler();
            throw;
        }
        Session::InterruptFlag::restore_signal_handler();

        status_ = outcome.interrupted ? "interrupted" : "completed";
        logger_.info("=== Session " + status_ + " after " + std::to_string(outcome.queries_asked) +
                     " queries ===");
        logger_.info("Estimated reward weights: " + Core::format_vector(outcome.estimate));
        if (!outcome.state_path.empty()) {
            logger_.info("Session state: " + outcome.state_path);
        }
        return outcome;
    } catch (const std::exception& e) {
        status_ = "failed";
        logger_.error("Session failed: " + std::string(e.what()));
        throw;
    }
}

} // namespace Executor
} // namespace ActivePref
