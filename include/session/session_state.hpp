#pragma once

#include "core/types.hpp"
#include "model/preference_model.hpp"
#include "sampling/belief.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ActivePref {
namespace Session {

enum class SessionStatus {
    InProgress,
    Interrupted,
    Completed
};

std::string to_string(SessionStatus status);
SessionStatus parse_session_status(const std::string& name);

/**
 * Everything needed to continue a session in a later process.
 *
 * Stored as JSON. Doubles are written in shortest round-trip form, so a
 * reloaded belief compares equal to the one that was saved.
 */
struct SessionState {
    std::string task;
    size_t dimension = 0;
    Core::QueryType query_type = Core::QueryType::Strict;
    Core::Criterion criterion = Core::Criterion::Information;
    Model::PreferenceModelParams model_params;
    double epsilon = 0.0;
    size_t max_queries = 0;
    size_t num_samples = 0;
    uint64_t seed = 0;
    bool reproducible = true;     // False when the seed came from std::random_device
    size_t queries_asked = 0;
    double last_score = 0.0;
    std::vector<Core::PreferenceConstraint> constraints;
    Sampling::Belief belief;
    SessionStatus status = SessionStatus::InProgress;

    nlohmann::json to_json() const;

    // @throws Core::SessionStateError on missing fields or inconsistent contents
    static SessionState from_json(const nlohmann::json& j);

    // Checks dimensions, answers and counters against each other
    void validate() const;

    void save(const std::string& filepath) const;
    static SessionState load(const std::string& filepath);
};

} // namespace Session
} // namespace ActivePref
