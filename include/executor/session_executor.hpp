#pragma once

#include "acquisition/candidate_source.hpp"
#include "config/configuration.hpp"
#include "data/trajectory_database.hpp"
#include "session/human_interface.hpp"
#include "session/session_loop.hpp"
#include "utils/logger.hpp"
#include <memory>
#include <string>

namespace ActivePref {
namespace Executor {

// Builds the candidate source and human from a configuration and runs a session
class SessionExecutor {
public:
    SessionExecutor(const Config::Configuration& config);

    // Run a fresh session, or continue the one saved at resume_path
    Session::SessionOutcome execute(const std::string& resume_path = "");

    // Get status of execution
    std::string get_status() const { return status_; }

    // Candidate database as configured: cache when present, otherwise CSV (and write the cache)
    Data::TrajectoryDatabase load_database() const;

private:
    const Config::Configuration& config_;
    Utils::ModuleLogger logger_;
    std::string status_;

    std::unique_ptr<Session::HumanInterface> make_human(const Model::PreferenceModel& model) const;
};

} // namespace Executor
} // namespace ActivePref
