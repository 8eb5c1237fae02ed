#include "config/configuration.hpp"
#include "utils/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace ActivePref {
namespace Config {

// Helper function to safely get optional values
template<typename T>
std::optional<T> get_optional(const json& j, const std::string& key) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return std::nullopt;
}

TaskConfig TaskConfig::from_json(const json& j) {
    TaskConfig config;
    config.name = j.at("name").get<std::string>();
    config.num_features = get_optional<int>(j, "num_features");
    return config;
}

SessionConfig SessionConfig::from_json(const json& j) {
    SessionConfig config;
    config.criterion = j.at("criterion").get<std::string>();
    config.query_type = j.at("query_type").get<std::string>();
    config.epsilon = j.at("epsilon").get<double>();
    config.num_samples = j.at("num_samples").get<int>();
    config.max_queries = j.at("max_queries").get<int>();
    config.output_dir = j.value("output_dir", std::string("sessions"));
    config.seed = get_optional<uint64_t>(j, "seed");
    return config;
}

ModelConfig ModelConfig::from_json(const json& j) {
    ModelConfig config;
    config.delta = get_optional<double>(j, "delta");
    config.beta = get_optional<double>(j, "beta");
    return config;
}

SamplerSection SamplerSection::from_json(const json& j) {
    SamplerSection config;
    config.burn_in = get_optional<int>(j, "burn_in");
    config.thin = get_optional<int>(j, "thin");
    config.step_size = get_optional<double>(j, "step_size");
    config.num_chains = get_optional<int>(j, "num_chains");
    config.max_consecutive_rejections = get_optional<int>(j, "max_consecutive_rejections");
    return config;
}

CandidatesConfig CandidatesConfig::from_json(const json& j) {
    CandidatesConfig config;
    config.mode = j.value("mode", std::string("database"));
    config.trajectories_file = get_optional<std::string>(j, "trajectories_file");
    config.cache_file = get_optional<std::string>(j, "cache_file");
    config.max_pairs = get_optional<int>(j, "max_pairs");
    return config;
}

HumanConfig HumanConfig::from_json(const json& j) {
    HumanConfig config;
    config.mode = j.at("mode").get<std::string>();
    config.true_reward = get_optional<std::vector<double>>(j, "true_reward");
    return config;
}

LoggingConfig LoggingConfig::from_json(const json& j) {
    LoggingConfig config;
    config.level = get_optional<std::string>(j, "level");
    config.directory = get_optional<std::string>(j, "directory");
    return config;
}

// Configuration implementations
std::unique_ptr<Configuration> Configuration::load_from_file(const std::string& filepath) {
    Utils::ModuleLogger logger("CONFIG");

    logger.info("Loading configuration from: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        logger.error("Failed to open configuration file: " + filepath);
        throw std::runtime_error("Cannot open configuration file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return load_from_string(buffer.str());
}

std::unique_ptr<Configuration> Configuration::load_from_string(const std::string& json_str) {
    Utils::ModuleLogger logger("CONFIG");

    try {
        json j = json::parse(json_str);

        auto config = std::make_unique<Configuration>();
        config->parse_json(j);

        logger.info("Configuration loaded successfully");
        return config;
    } catch (const json::exception& e) {
        logger.error("JSON parsing error: " + std::string(e.what()));
        throw std::runtime_error("Invalid JSON configuration: " + std::string(e.what()));
    }
}

void Configuration::parse_json(const json& j) {
    if (!j.contains("task") || !j.contains("session") ||
        !j.contains("candidates") || !j.contains("human")) {
        throw std::runtime_error("Configuration missing required sections");
    }

    task_config_ = TaskConfig::from_json(j["task"]);
    session_config_ = SessionConfig::from_json(j["session"]);
    candidates_config_ = CandidatesConfig::from_json(j["candidates"]);
    human_config_ = HumanConfig::from_json(j["human"]);

    // Optional sections fall back to defaults
    model_config_ = ModelConfig::from_json(j.value("model", json::object()));
    sampler_config_ = SamplerSection::from_json(j.value("sampler", json::object()));
    logging_config_ = LoggingConfig::from_json(j.value("logging", json::object()));
}

size_t Configuration::feature_dimension() const {
    if (task_config_.num_features.has_value()) {
        return task_config_.num_features.value() > 0 ? static_cast<size_t>(task_config_.num_features.value()) : 0;
    }
    return Core::task_dimension(task_config_.name);
}

bool Configuration::validate() const {
    Utils::ModuleLogger logger("CONFIG");

    if (task_config_.name.empty()) {
        logger.error("Task name must not be empty");
        return false;
    }
    const size_t known = Core::task_dimension(task_config_.name);
    if (task_config_.num_features.has_value()) {
        if (task_config_.num_features.value() <= 0) {
            logger.error("num_features must be positive");
            return false;
        }
        if (known != 0 && known != static_cast<size_t>(task_config_.num_features.value())) {
            logger.error("Task '" + task_config_.name + "' has " + std::to_string(known) +
                         " features, configuration says " + std::to_string(task_config_.num_features.value()));
            return false;
        }
    } else if (known == 0) {
        logger.warning("Unknown task '" + task_config_.name + "', feature count taken from the candidates");
    }

    // Validate session
    Core::QueryType query_type = Core::QueryType::Strict;
    try {
        Core::parse_criterion(session_config_.criterion);
        query_type = Core::parse_query_type(session_config_.query_type);
    } catch (const std::invalid_argument& e) {
        logger.error(e.what());
        return false;
    }
    if (session_config_.epsilon < 0.0) {
        logger.error("epsilon must be non-negative");
        return false;
    }
    if (session_config_.num_samples <= 0 || session_config_.max_queries <= 0) {
        logger.error("num_samples and max_queries must be positive");
        return false;
    }

    // Validate answer model
    const double delta = model_config_.delta.value_or(0.0);
    const double beta = model_config_.beta.value_or(1.0);
    if (delta < 0.0 || beta <= 0.0) {
        logger.error("Model requires delta >= 0 and beta > 0");
        return false;
    }
    if (query_type == Core::QueryType::Strict && delta > 0.0) {
        logger.warning("delta is ignored for strict queries");
    }

    // Validate sampler
    if ((sampler_config_.thin.has_value() && sampler_config_.thin.value() <= 0) ||
        (sampler_config_.burn_in.has_value() && sampler_config_.burn_in.value() < 0) ||
        (sampler_config_.step_size.has_value() && sampler_config_.step_size.value() <= 0.0) ||
        (sampler_config_.num_chains.has_value() && sampler_config_.num_chains.value() <= 0) ||
        (sampler_config_.max_consecutive_rejections.has_value() &&
         sampler_config_.max_consecutive_rejections.value() <= 0)) {
        logger.error("Invalid sampler parameters");
        return false;
    }

    // Validate candidates
    if (candidates_config_.mode != "database") {
        logger.error("Invalid candidate mode: " + candidates_config_.mode);
        return false;
    }
    if (!candidates_config_.trajectories_file.has_value() && !candidates_config_.cache_file.has_value()) {
        logger.error("Database candidates need trajectories_file or cache_file");
        return false;
    }
    if (candidates_config_.max_pairs.has_value() && candidates_config_.max_pairs.value() <= 0) {
        logger.error("max_pairs must be positive");
        return false;
    }

    // Validate human
    if (human_config_.mode != "console" && human_config_.mode != "simulated") {
        logger.error("Invalid human mode: " + human_config_.mode);
        return false;
    }
    if (human_config_.mode == "simulated") {
        if (!human_config_.true_reward.has_value()) {
            logger.error("Simulated human requires true_reward");
            return false;
        }
        const size_t dim = feature_dimension();
        if (dim != 0 && human_config_.true_reward->size() != dim) {
            logger.error("true_reward has " + std::to_string(human_config_.true_reward->size()) +
                         " entries, expected " + std::to_string(dim));
            return false;
        }
    }

    if (logging_config_.level.has_value()) {
        try {
            Utils::parse_log_level(logging_config_.level.value());
        } catch (const std::invalid_argument& e) {
            logger.error(e.what());
            return false;
        }
    }

    logger.info("Configuration validation successful");
    return true;
}

std::string Configuration::state_path() const {
    std::filesystem::path dir(session_config_.output_dir);
    return (dir / (task_config_.name + "_" + session_config_.criterion + "_" +
                   session_config_.query_type + "_session.json")).string();
}

Session::SessionOptions Configuration::session_options() const {
    Session::SessionOptions options;
    options.task = task_config_.name;
    options.query_type = Core::parse_query_type(session_config_.query_type);
    options.criterion = Core::parse_criterion(session_config_.criterion);
    options.model_params.delta = model_config_.delta.value_or(0.0);
    options.model_params.beta = model_config_.beta.value_or(1.0);
    options.stop.epsilon = session_config_.epsilon;
    options.stop.max_queries = static_cast<size_t>(session_config_.max_queries);
    options.num_samples = static_cast<size_t>(session_config_.num_samples);
    options.seed = session_config_.seed;

    if (sampler_config_.burn_in.has_value()) {
        options.sampler.burn_in = static_cast<size_t>(sampler_config_.burn_in.value());
    }
    if (sampler_config_.thin.has_value()) {
        options.sampler.thin = static_cast<size_t>(sampler_config_.thin.value());
    }
    if (sampler_config_.step_size.has_value()) {
        options.sampler.step_size = sampler_config_.step_size.value();
    }
    if (sampler_config_.num_chains.has_value()) {
        options.sampler.num_chains = static_cast<size_t>(sampler_config_.num_chains.value());
    }
    if (sampler_config_.max_consecutive_rejections.has_value()) {
        options.sampler.max_consecutive_rejections =
            static_cast<size_t>(sampler_config_.max_consecutive_rejections.value());
    }

    options.state_path = state_path();
    return options;
}

void Configuration::apply_logging() const {
    if (logging_config_.directory.has_value()) {
        Utils::Logger::instance().set_log_directory(logging_config_.directory.value());
    }
    if (logging_config_.level.has_value()) {
        Utils::Logger::instance().set_min_level(Utils::parse_log_level(logging_config_.level.value()));
    }
}

void Configuration::print_summary() const {
    Utils::ModuleLogger logger("CONFIG");

    logger.info("=== Configuration Summary ===");
    logger.info("");

    logger.info("Task:");
    logger.info("  Name: " + task_config_.name);
    if (task_config_.num_features.has_value()) {
        logger.info("  Features: " + std::to_string(task_config_.num_features.value()));
    }

    logger.info("");
    logger.info("Session:");
    logger.info("  Criterion: " + session_config_.criterion);
    logger.info("  Query type: " + session_config_.query_type);
    logger.info("  Epsilon: " + std::to_string(session_config_.epsilon));
    logger.info("  Samples: " + std::to_string(session_config_.num_samples));
    logger.info("  Max queries: " + std::to_string(session_config_.max_queries));
    logger.info("  Output directory: " + session_config_.output_dir);
    if (session_config_.seed.has_value()) {
        logger.info("  Seed: " + std::to_string(session_config_.seed.value()));
    } else {
        logger.info("  Seed: random");
    }

    logger.info("");
    logger.info("Answer model:");
    logger.info("  delta: " + std::to_string(model_config_.delta.value_or(0.0)));
    logger.info("  beta: " + std::to_string(model_config_.beta.value_or(1.0)));

    if (sampler_config_.burn_in.has_value() || sampler_config_.thin.has_value() ||
        sampler_config_.step_size.has_value() || sampler_config_.num_chains.has_value()) {
        logger.info("");
        logger.info("Sampler:");
        if (sampler_config_.burn_in.has_value()) {
            logger.info("  Burn-in: " + std::to_string(sampler_config_.burn_in.value()));
        }
        if (sampler_config_.thin.has_value()) {
            logger.info("  Thin: " + std::to_string(sampler_config_.thin.value()));
        }
        if (sampler_config_.step_size.has_value()) {
            logger.info("  Step size: " + std::to_string(sampler_config_.step_size.value()));
        }
        if (sampler_config_.num_chains.has_value()) {
            logger.info("  Chains: " + std::to_string(sampler_config_.num_chains.value()));
        }
    }

    logger.info("");
    logger.info("Candidates:");
    logger.info("  Mode: " + candidates_config_.mode);
    if (candidates_config_.trajectories_file.has_value()) {
        logger.info("  Trajectories: " + candidates_config_.trajectories_file.value());
    }
    if (candidates_config_.cache_file.has_value()) {
        logger.info("  Cache: " + candidates_config_.cache_file.value());
    }
    if (candidates_config_.max_pairs.has_value()) {
        logger.info("  Max pairs: " + std::to_string(candidates_config_.max_pairs.value()));
    }

    logger.info("");
    logger.info("Human: " + human_config_.mode);
    if (human_config_.true_reward.has_value()) {
        logger.info("  True reward: " + Core::format_vector(human_config_.true_reward.value()));
    }

    logger.info("==============================");
}

} // namespace Config
} // namespace ActivePref
