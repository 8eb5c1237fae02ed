#include "analysis/constraint_filter.hpp"
#include "analysis/evaluation.hpp"
#include "config/configuration.hpp"
#include "data/trajectory_database.hpp"
#include "executor/session_executor.hpp"
#include "session/session_state.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ActivePref;

void print_usage(const std::string& program_name) {
    std::cout << "ActivePref CLI - Active Preference-Based Reward Learning\n";
    std::cout << "=========================================================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " --config <config_file.json> [--resume <state.json>]\n";
    std::cout << "  " << program_name << " --validate <config_file.json>\n";
    std::cout << "  " << program_name << " --list-configs\n";
    std::cout << "  " << program_name << " --build-cache <trajectories.csv> <cache.bin> [options]\n";
    std::cout << "  " << program_name << " --filter <state.json> [options]\n";
    std::cout << "  " << program_name << " --evaluate <state.json> --true-reward <w> [options]\n";
    std::cout << "  " << program_name << " --help\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config, -c <file>     Run a preference session from a JSON configuration\n";
    std::cout << "    --resume <state>      Continue a saved session\n";
    std::cout << "  --validate <file>       Validate configuration file without running\n";
    std::cout << "  --list-configs          List all available configuration files\n";
    std::cout << "  --build-cache <csv> <bin>  Pre-process a trajectory database\n";
    std::cout << "    --max-pairs <n>       Candidate pairs to keep (default: 100000)\n";
    std::cout << "    --seed <n>            Seed for pair sampling (default: 0)\n";
    std::cout << "  --filter <state>        Filter recorded answers into test questions\n";
    std::cout << "    --out <file>          Write the report as JSON\n";
    std::cout << "    --noise-threshold <x> Minimum belief agreement (default: 0.7)\n";
    std::cout << "    --epsilon <x>         Required value gap (default: 0)\n";
    std::cout << "    --delta <x>           Allowed miss probability (default: 0.05)\n";
    std::cout << "    --skip-duplicates, --skip-noise, --skip-epsilon, --skip-redundancy\n";
    std::cout << "  --evaluate <state>      Score a session against a known reward\n";
    std::cout << "    --true-reward <w>     Comma-separated reward weights\n";
    std::cout << "    --noise <x>           Variance of reward perturbations (default: 1.0)\n";
    std::cout << "    --n-rewards <n>       Perturbed rewards to test (default: 100)\n";
    std::cout << "  --help, -h              Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " --config configs/driver_information_strict.json\n";
    std::cout << "  " << program_name << " --config configs/driver_information_strict.json"
              << " --resume sessions/driver_information_strict_session.json\n";
    std::cout << "  " << program_name << " --build-cache data/driver_trajectories.csv data/driver.cache\n";
    std::cout << "  " << program_name << " --evaluate sessions/driver_volume_weak_session.json"
              << " --true-reward 0.5,-0.5,0.5,0.5\n\n";
}

std::vector<double> parse_vector(const std::string& text) {
    std::vector<double> values;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        values.push_back(std::stod(item));
    }
    if (values.empty()) {
        throw std::invalid_argument("Empty vector: '" + text + "'");
    }
    return values;
}

// Value following a flag, empty if absent
std::string option_value(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) {
        return "";
    }
    return *(it + 1);
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

void list_configs() {
    std::cout << "Available Configuration Files:\n";
    std::cout << "==============================\n\n";

    std::string configs_dir = "configs";

    if (!fs::exists(configs_dir) || !fs::is_directory(configs_dir)) {
        std::cout << "No configs directory found.\n";
        return;
    }

    std::vector<std::string> config_files;

    for (const auto& entry : fs::directory_iterator(configs_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            config_files.push_back(entry.path().string());
        }
    }

    std::sort(config_files.begin(), config_files.end());

    if (config_files.empty()) {
        std::cout << "No JSON configuration files found in configs/\n";
        return;
    }

    for (const auto& file : config_files) {
        std::cout << "  - " << file << "\n";

        try {
            auto config = Config::Configuration::load_from_file(file);
            const auto& session = config->get_session_config();
            std::cout << "    Task: " << config->get_task_config().name
                      << " | Criterion: " << session.criterion
                      << " | Queries: " << session.query_type
                      << " | Human: " << config->get_human_config().mode << "\n\n";
        } catch (const std::exception& e) {
            std::cout << "    (Unable to parse: " << e.what() << ")\n\n";
        }
    }
}

bool validate_config(const std::string& config_file) {
    Utils::ModuleLogger logger("VALIDATE");

    logger.info("Validating configuration file: " + config_file);

    try {
        auto config = Config::Configuration::load_from_file(config_file);

        logger.info("");
        config->print_summary();
        logger.info("");

        if (config->validate()) {
            logger.info("✓ Configuration is valid!");
            return true;
        } else {
            logger.error("✗ Configuration validation failed!");
            return false;
        }
    } catch (const std::exception& e) {
        logger.error("Error loading configuration: " + std::string(e.what()));
        return false;
    }
}

int build_cache(const std::string& csv_path, const std::string& cache_path, const std::vector<std::string>& args) {
    Utils::ModuleLogger logger("CACHE");

    try {
        std::string max_pairs_text = option_value(args, "--max-pairs");
        std::string seed_text = option_value(args, "--seed");
        size_t max_pairs = max_pairs_text.empty() ? 100000 : std::stoul(max_pairs_text);
        uint64_t seed = seed_text.empty() ? 0 : std::stoull(seed_text);

        auto db = Data::TrajectoryDatabase::load_csv(csv_path);
        db.build_pairs(max_pairs, seed);
        db.save_cache(cache_path);

        logger.info("✓ Cache written: " + std::to_string(db.num_trajectories()) + " trajectories, " +
                    std::to_string(db.num_pairs()) + " pairs");
        return 0;
    } catch (const std::exception& e) {
        logger.error("Cache build failed: " + std::string(e.what()));
        return 1;
    }
}

int filter_session(const std::string& state_path, const std::vector<std::string>& args) {
    Utils::ModuleLogger logger("FILTER");

    try {
        auto state = Session::SessionState::load(state_path);

        Analysis::FilterOptions options;
        std::string value = option_value(args, "--noise-threshold");
        if (!value.empty()) options.noise_threshold = std::stod(value);
        value = option_value(args, "--epsilon");
        if (!value.empty()) options.epsilon = std::stod(value);
        value = option_value(args, "--delta");
        if (!value.empty()) options.delta = std::stod(value);
        options.skip_remove_duplicates = has_flag(args, "--skip-duplicates");
        options.skip_noise_filtering = has_flag(args, "--skip-noise");
        options.skip_epsilon_filtering = has_flag(args, "--skip-epsilon");
        options.skip_redundancy_filtering = has_flag(args, "--skip-redundancy");

        auto report = Analysis::ConstraintFilter::run(state.constraints, state.belief, options);

        logger.info("Kept " + std::to_string(report.kept.size()) + " of " + std::to_string(report.input) +
                    " answers");

        nlohmann::json out;
        out["input"] = report.input;
        out["half_spaces"] = report.half_spaces;
        out["after_duplicates"] = report.after_duplicates;
        out["after_noise"] = report.after_noise;
        out["after_epsilon"] = report.after_epsilon;
        out["after_redundancy"] = report.after_redundancy;
        out["kept"] = report.kept;
        nlohmann::json tests = nlohmann::json::array();
        for (size_t i : report.kept) {
            const auto& c = state.constraints[i];
            tests.push_back({{"delta", c.delta}, {"answer", c.answer}, {"a", c.a_id}, {"b", c.b_id}});
        }
        out["tests"] = tests;

        std::string out_path = option_value(args, "--out");
        if (out_path.empty()) {
            std::cout << out.dump(2) << "\n";
        } else {
            std::ofstream file(out_path);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot open report file: " + out_path);
            }
            file << out.dump(2) << "\n";
            logger.info("Report written to " + out_path);
        }
        return 0;
    } catch (const std::exception& e) {
        logger.error("Filtering failed: " + std::string(e.what()));
        return 1;
    }
}

int evaluate_session(const std::string& state_path, const std::vector<std::string>& args) {
    Utils::ModuleLogger logger("EVALUATE");

    try {
        std::string reward_text = option_value(args, "--true-reward");
        if (reward_text.empty()) {
            throw std::invalid_argument("--evaluate requires --true-reward");
        }
        Core::WeightVector true_reward = parse_vector(reward_text);

        std::string noise_text = option_value(args, "--noise");
        std::string count_text = option_value(args, "--n-rewards");
        double noise = noise_text.empty() ? 1.0 : std::stod(noise_text);
        size_t n_rewards = count_text.empty() ? 100 : std::stoul(count_text);

        auto state = Session::SessionState::load(state_path);
        if (true_reward.size() != state.dimension) {
            throw Core::DimensionMismatchError("True reward does not match session", state.dimension,
                                               true_reward.size());
        }

        Core::WeightVector estimate = state.belief.mean_direction();
        double alignment = Analysis::Evaluation::alignment(estimate, true_reward);
        double pass_rate = Analysis::Evaluation::pass_rate(true_reward, state.constraints, noise, n_rewards,
                                                           state.seed);
        double agreement = Analysis::Evaluation::agreement(Core::normalized(true_reward), state.constraints);

        logger.info("Estimate: " + Core::format_vector(estimate));
        logger.info("Alignment with true reward: " + std::to_string(alignment));
        logger.info("Answers consistent with true reward: " + std::to_string(agreement));
        logger.info("Pass rate of " + std::to_string(n_rewards) + " rewards at noise " +
                    std::to_string(noise) + ": " + std::to_string(pass_rate));
        return 0;
    } catch (const std::exception& e) {
        logger.error("Evaluation failed: " + std::string(e.what()));
        return 1;
    }
}

int main(int argc, char* argv[]) {
    // Initialize logger
    Utils::Logger::instance().set_log_directory("logs");
    Utils::ModuleLogger main_logger("CLI");

    // Parse command line arguments
    std::vector<std::string> args(argv, argv + argc);

    if (argc < 2) {
        print_usage(args[0]);
        return 1;
    }

    std::string command = args[1];

    // Handle help
    if (command == "--help" || command == "-h") {
        print_usage(args[0]);
        return 0;
    }

    // Handle list configs
    if (command == "--list-configs") {
        list_configs();
        return 0;
    }

    // Handle validate
    if (command == "--validate") {
        if (argc < 3) {
            std::cerr << "Error: --validate requires a configuration file path\n";
            print_usage(args[0]);
            return 1;
        }

        return validate_config(args[2]) ? 0 : 1;
    }

    // Handle cache building
    if (command == "--build-cache") {
        if (argc < 4) {
            std::cerr << "Error: --build-cache requires a trajectory file and a cache path\n";
            print_usage(args[0]);
            return 1;
        }
        std::vector<std::string> extra_args(args.begin() + 4, args.end());
        return build_cache(args[2], args[3], extra_args);
    }

    // Handle filtering
    if (command == "--filter") {
        if (argc < 3) {
            std::cerr << "Error: --filter requires a session state file\n";
            print_usage(args[0]);
            return 1;
        }
        std::vector<std::string> extra_args(args.begin() + 3, args.end());
        return filter_session(args[2], extra_args);
    }

    // Handle evaluation
    if (command == "--evaluate") {
        if (argc < 3) {
            std::cerr << "Error: --evaluate requires a session state file\n";
            print_usage(args[0]);
            return 1;
        }
        std::vector<std::string> extra_args(args.begin() + 3, args.end());
        return evaluate_session(args[2], extra_args);
    }

    // Handle session execution
    if (command == "--config" || command == "-c") {
        if (argc < 3) {
            std::cerr << "Error: " << command << " requires a configuration file path\n";
            print_usage(args[0]);
            return 1;
        }

        std::string config_file = args[2];
        std::vector<std::string> extra_args(args.begin() + 3, args.end());
        std::string resume_path = option_value(extra_args, "--resume");
        if (has_flag(extra_args, "--resume") && resume_path.empty()) {
            std::cerr << "Error: --resume requires a session state file\n";
            return 1;
        }

        main_logger.info("=== ActivePref CLI ===");
        main_logger.info("Configuration file: " + config_file);
        if (!resume_path.empty()) {
            main_logger.info("Resuming from: " + resume_path);
        }
        main_logger.info("");

        try {
            // Load configuration
            auto config = Config::Configuration::load_from_file(config_file);
            config->apply_logging();

            // Print configuration summary
            main_logger.info("");
            config->print_summary();
            main_logger.info("");

            // Validate configuration
            if (!config->validate()) {
                main_logger.error("Configuration validation failed. Aborting.");
                return 1;
            }

            main_logger.info("");

            Executor::SessionExecutor executor(*config);
            executor.execute(resume_path);

            main_logger.info("");
            main_logger.info("Execution status: " + executor.get_status());

            return 0;

        } catch (const std::exception& e) {
            main_logger.error("Error: " + std::string(e.what()));
            return 1;
        }
    }

    // Unknown command
    std::cerr << "Error: Unknown command '" << command << "'\n\n";
    print_usage(args[0]);
    return 1;
}
