#include "session/session_state.hpp"
#include "utils/logger.hpp"
#include <filesystem>
#include <fstream>

namespace ActivePref {
namespace Session {

using json = nlohmann::json;

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::InProgress: return "in_progress";
        case SessionStatus::Interrupted: return "interrupted";
        case SessionStatus::Completed: return "completed";
    }
    return "unknown";
}

SessionStatus parse_session_status(const std::string& name) {
    if (name == "in_progress") return SessionStatus::InProgress;
    if (name == "interrupted") return SessionStatus::Interrupted;
    if (name == "completed") return SessionStatus::Completed;
    throw Core::SessionStateError("Unknown session status: " + name);
}

json SessionState::to_json() const {
    json j;
    j["task"] = task;
    j["dimension"] = dimension;
    j["query_type"] = Core::to_string(query_type);
    j["criterion"] = Core::to_string(criterion);
    j["model"] = {{"delta", model_params.delta}, {"beta", model_params.beta}};
    j["epsilon"] = epsilon;
    j["max_queries"] = max_queries;
    j["num_samples"] = num_samples;
    j["seed"] = seed;
    j["reproducible"] = reproducible;
    j["queries_asked"] = queries_asked;
    j["last_score"] = last_score;
    j["status"] = to_string(status);

    json history = json::array();
    for (const auto& c : constraints) {
        history.push_back({{"delta", c.delta}, {"answer", c.answer}, {"a", c.a_id}, {"b", c.b_id}});
    }
    j["constraints"] = history;

    json samples = json::array();
    for (const auto& s : belief.samples()) {
        samples.push_back({{"w", s.w}, {"weight", s.weight}});
    }
    j["belief"] = samples;
    return j;
}

SessionState SessionState::from_json(const json& j) {
    SessionState state;
    try {
        state.task = j.at("task").get<std::string>();
        state.dimension = j.at("dimension").get<size_t>();
        state.query_type = Core::parse_query_type(j.at("query_type").get<std::string>());
        state.criterion = Core::parse_criterion(j.at("criterion").get<std::string>());
        const auto& model = j.at("model");
        state.model_params.delta = model.at("delta").get<double>();
        state.model_params.beta = model.at("beta").get<double>();
        state.epsilon = j.at("epsilon").get<double>();
        state.max_queries = j.at("max_queries").get<size_t>();
        state.num_samples = j.at("num_samples").get<size_t>();
        state.seed = j.at("seed").get<uint64_t>();
        state.reproducible = j.value("reproducible", true);
        state.queries_asked = j.at("queries_asked").get<size_t>();
        state.last_score = j.value("last_score", 0.0);
        state.status = parse_session_status(j.at("status").get<std::string>());

        for (const auto& item : j.at("constraints")) {
            Core::PreferenceConstraint c;
            c.delta = item.at("delta").get<std::vector<double>>();
            c.answer = item.at("answer").get<int>();
            c.a_id = item.value("a", "");
            c.b_id = item.value("b", "");
            state.constraints.push_back(std::move(c));
        }

        std::vector<Sampling::WeightedSample> samples;
        for (const auto& item : j.at("belief")) {
            Sampling::WeightedSample s;
            s.w = item.at("w").get<std::vector<double>>();
            s.weight = item.value("weight", 1.0);
            samples.push_back(std::move(s));
        }
        state.belief = Sampling::Belief(std::move(samples));
    } catch (const json::exception& e) {
        throw Core::SessionStateError(std::string("Malformed session state: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw Core::SessionStateError(std::string("Invalid session state: ") + e.what());
    } catch (const Core::DimensionMismatchError& e) {
        throw Core::SessionStateError(std::string("Invalid session belief: ") + e.what());
    }

    state.validate();
    return state;
}

void SessionState::validate() const {
    if (dimension == 0) {
        throw Core::SessionStateError("Session dimension must be positive");
    }
    if (num_samples == 0) {
        throw Core::SessionStateError("Session sample count must be positive");
    }
    if (queries_asked != constraints.size()) {
        throw Core::SessionStateError("Query counter (" + std::to_string(queries_asked) +
                                      ") does not match constraint history (" +
                                      std::to_string(constraints.size()) + ")");
    }

    Model::PreferenceModel model(query_type, model_params);
    for (size_t i = 0; i < constraints.size(); ++i) {
        if (constraints[i].delta.size() != dimension) {
            throw Core::SessionStateError("Constraint " + std::to_string(i) + " has dimension " +
                                          std::to_string(constraints[i].delta.size()) + ", expected " +
                                          std::to_string(dimension));
        }
        try {
            model.validate_answer(constraints[i].answer);
        } catch (const std::invalid_argument& e) {
            throw Core::SessionStateError("Constraint " + std::to_string(i) + ": " + e.what());
        }
    }

    if (!belief.empty()) {
        if (belief.dimension() != dimension) {
            throw Core::SessionStateError("Belief dimension " + std::to_string(belief.dimension()) +
                                          " does not match session dimension " + std::to_string(dimension));
        }
        if (belief.size() != num_samples) {
            throw Core::SessionStateError("Belief holds " + std::to_string(belief.size()) +
                                          " samples, expected " + std::to_string(num_samples));
        }
    }
}

void SessionState::save(const std::string& filepath) const {
    Utils::ModuleLogger logger("SESSION");

    std::filesystem::path path(filepath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    // Write then rename so a crash never leaves a half-written state
    const std::string tmp = filepath + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open session file for writing: " + tmp);
        }
        file << to_json().dump(2) << "\n";
        if (!file) {
            throw std::runtime_error("Failed to write session file: " + tmp);
        }
    }
    std::filesystem::rename(tmp, filepath);

    logger.info("Saved session (" + to_string(status) + ", " + std::to_string(constraints.size()) +
                " constraints) to " + filepath);
}

SessionState SessionState::load(const std::string& filepath) {
    Utils::ModuleLogger logger("SESSION");

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open session file: " + filepath);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw Core::SessionStateError("Failed to parse session file " + filepath + ": " + e.what());
    }

    SessionState state = from_json(j);
    logger.info("Loaded session '" + state.task + "' (" + to_string(state.status) + ", " +
                std::to_string(state.constraints.size()) + " constraints) from " + filepath);
    return state;
}

} // namespace Session
} // namespace ActivePref
