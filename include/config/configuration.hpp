#pragma once

#include "session/session_loop.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ActivePref {
namespace Config {

using json = nlohmann::json;

// Task configuration
struct TaskConfig {
    std::string name;
    std::optional<int> num_features;   // Required for tasks without a known feature count

    static TaskConfig from_json(const json& j);
};

// Session configuration
struct SessionConfig {
    std::string criterion;      // "information", "volume" or "random"
    std::string query_type;     // "strict" or "weak"
    double epsilon;
    int num_samples;
    int max_queries;
    std::string output_dir;
    std::optional<uint64_t> seed;

    static SessionConfig from_json(const json& j);
};

// Answer model configuration
struct ModelConfig {
    std::optional<double> delta;
    std::optional<double> beta;

    static ModelConfig from_json(const json& j);
};

// Posterior sampler configuration
struct SamplerSection {
    std::optional<int> burn_in;
    std::optional<int> thin;
    std::optional<double> step_size;
    std::optional<int> num_chains;
    std::optional<int> max_consecutive_rejections;

    static SamplerSection from_json(const json& j);
};

// Candidate source configuration
struct CandidatesConfig {
    std::string mode;                              // "database"
    std::optional<std::string> trajectories_file;  // CSV: id,f1,...,fD
    std::optional<std::string> cache_file;         // Binary cache written by --build-cache
    std::optional<int> max_pairs;

    static CandidatesConfig from_json(const json& j);
};

// Who answers the queries
struct HumanConfig {
    std::string mode;                                // "console" or "simulated"
    std::optional<std::vector<double>> true_reward;  // Simulated answers only

    static HumanConfig from_json(const json& j);
};

// Logging configuration
struct LoggingConfig {
    std::optional<std::string> level;
    std::optional<std::string> directory;

    static LoggingConfig from_json(const json& j);
};

// Main configuration class
class Configuration {
public:
    Configuration() = default;

    // Load configuration from JSON file
    static std::unique_ptr<Configuration> load_from_file(const std::string& filepath);

    // Parse configuration from JSON string
    static std::unique_ptr<Configuration> load_from_string(const std::string& json_str);

    // Validate configuration
    bool validate() const;

    // Print configuration summary
    void print_summary() const;

    // Feature dimension: explicit num_features or the task's known dimension, 0 if neither
    size_t feature_dimension() const;

    // Path of the session state file inside output_dir
    std::string state_path() const;

    // Settings consumed by the session loop
    Session::SessionOptions session_options() const;

    // Apply logging level and directory to the global logger
    void apply_logging() const;

    // Getters
    const TaskConfig& get_task_config() const { return task_config_; }
    const SessionConfig& get_session_config() const { return session_config_; }
    const ModelConfig& get_model_config() const { return model_config_; }
    const SamplerSection& get_sampler_config() const { return sampler_config_; }
    const CandidatesConfig& get_candidates_config() const { return candidates_config_; }
    const HumanConfig& get_human_config() const { return human_config_; }
    const LoggingConfig& get_logging_config() const { return logging_config_; }

private:
    TaskConfig task_config_;
    SessionConfig session_config_;
    ModelConfig model_config_;
    SamplerSection sampler_config_;
    CandidatesConfig candidates_config_;
    HumanConfig human_config_;
    LoggingConfig logging_config_;

    void parse_json(const json& j);
};

} // namespace Config
} // namespace ActivePref
