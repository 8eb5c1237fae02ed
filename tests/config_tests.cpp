#include "config/configuration.hpp"
#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace ActivePref;

namespace {

const std::string VALID_CONFIG = R"({
    "task": { "name": "driver" },
    "session": {
        "criterion": "volume",
        "query_type": "weak",
        "epsilon": 0.05,
        "num_samples": 200,
        "max_queries": 25,
        "output_dir": "out",
        "seed": 42
    },
    "model": { "delta": 0.4, "beta": 2.0 },
    "sampler": { "burn_in": 500, "thin": 10, "step_size": 0.2, "num_chains": 4 },
    "candidates": { "mode": "database", "cache_file": "data/driver.cache", "max_pairs": 5000 },
    "human": { "mode": "simulated", "true_reward": [0.1, -0.2, 0.9, 0.3] },
    "logging": { "level": "warning" }
})";

std::string replace(std::string text, const std::string& from, const std::string& to) {
    size_t pos = text.find(from);
    assert(pos != std::string::npos);
    return text.replace(pos, from.size(), to);
}

} // namespace

void test_load_valid_config() {
    std::cout << "Testing valid configuration..." << std::endl;

    auto config = Config::Configuration::load_from_string(VALID_CONFIG);
    assert(config != nullptr);
    assert(config->validate());

    assert(config->get_task_config().name == "driver");
    assert(!config->get_task_config().num_features.has_value());
    assert(config->feature_dimension() == 4);
    assert(config->get_candidates_config().cache_file.value() == "data/driver.cache");
    assert(!config->get_candidates_config().trajectories_file.has_value());
    assert(config->get_human_config().true_reward->size() == 4);

    std::cout << "  ✓ Valid configuration tests passed" << std::endl;
}

void test_session_options() {
    std::cout << "Testing session options mapping..." << std::endl;

    auto config = Config::Configuration::load_from_string(VALID_CONFIG);
    Session::SessionOptions options = config->session_options();

    assert(options.task == "driver");
    assert(options.criterion == Core::Criterion::Volume);
    assert(options.query_type == Core::QueryType::Weak);
    assert(options.model_params.delta == 0.4);
    assert(options.model_params.beta == 2.0);
    assert(options.stop.epsilon == 0.05);
    assert(options.stop.max_queries == 25);
    assert(options.num_samples == 200);
    assert(options.seed.has_value() && *options.seed == 42);
    assert(options.sampler.burn_in == 500);
    assert(options.sampler.thin == 10);
    assert(options.sampler.step_size == 0.2);
    assert(options.sampler.num_chains == 4);

    std::string expected = (std::filesystem::path("out") / "driver_volume_weak_session.json").string();
    assert(config->state_path() == expected);
    assert(options.state_path == expected);

    std::cout << "  ✓ Session options tests passed" << std::endl;
}

void test_defaults() {
    std::cout << "Testing optional sections..." << std::endl;

    auto config = Config::Configuration::load_from_string(R"({
        "task": { "name": "lunarlander", "num_features": 6 },
        "session": { "criterion": "information", "query_type": "strict",
                     "epsilon": 0.0, "num_samples": 50, "max_queries": 10 },
        "candidates": { "trajectories_file": "data/lunarlander.csv" },
        "human": { "mode": "console" }
    })");
    assert(config->validate());
    assert(config->feature_dimension() == 6);
    assert(config->get_session_config().output_dir == "sessions");
    assert(config->get_candidates_config().mode == "database");

    auto options = config->session_options();
    assert(!options.seed.has_value());
    assert(options.model_params.delta == 0.0);
    assert(options.model_params.beta == 1.0);
    Sampling::SamplerConfig defaults;
    assert(options.sampler.burn_in == defaults.burn_in);
    assert(options.sampler.thin == defaults.thin);

    std::cout << "  ✓ Optional section tests passed" << std::endl;
}

void test_invalid_json() {
    std::cout << "Testing malformed configuration..." << std::endl;

    bool threw = false;
    try {
        Config::Configuration::load_from_string("{ \"task\": ");
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find("Invalid JSON configuration") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        Config::Configuration::load_from_string(R"({ "task": { "name": "driver" } })");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    // Required key missing inside a section
    threw = false;
    try {
        Config::Configuration::load_from_string(replace(VALID_CONFIG, "\"epsilon\": 0.05,", ""));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Config::Configuration::load_from_file("does/not/exist.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Malformed configuration tests passed" << std::endl;
}

void test_validation_failures() {
    std::cout << "Testing validation failures..." << std::endl;

    auto check_invalid = [](const std::string& text) {
        auto config = Config::Configuration::load_from_string(text);
        assert(!config->validate());
    };

    check_invalid(replace(VALID_CONFIG, "\"volume\"", "\"entropy\""));
    check_invalid(replace(VALID_CONFIG, "\"weak\"", "\"ranked\""));
    check_invalid(replace(VALID_CONFIG, "\"epsilon\": 0.05", "\"epsilon\": -1"));
    check_invalid(replace(VALID_CONFIG, "\"num_samples\": 200", "\"num_samples\": 0"));
    check_invalid(replace(VALID_CONFIG, "\"delta\": 0.4", "\"delta\": -0.4"));
    check_invalid(replace(VALID_CONFIG, "\"beta\": 2.0", "\"beta\": 0"));
    check_invalid(replace(VALID_CONFIG, "\"thin\": 10", "\"thin\": 0"));
    check_invalid(replace(VALID_CONFIG, "\"mode\": \"database\"", "\"mode\": \"continuous\""));
    check_invalid(replace(VALID_CONFIG, "\"cache_file\": \"data/driver.cache\", ", ""));
    check_invalid(replace(VALID_CONFIG, ", \"true_reward\": [0.1, -0.2, 0.9, 0.3]", ""));
    check_invalid(replace(VALID_CONFIG, "[0.1, -0.2, 0.9, 0.3]", "[0.1, -0.2]"));
    check_invalid(replace(VALID_CONFIG, "\"mode\": \"simulated\"", "\"mode\": \"telepathic\""));
    check_invalid(replace(VALID_CONFIG, "{ \"name\": \"driver\" }", "{ \"name\": \"driver\", \"num_features\": 3 }"));
    check_invalid(replace(VALID_CONFIG, "\"warning\"", "\"loud\""));

    std::cout << "  ✓ Validation failure tests passed" << std::endl;
}

int main() {
    std::cout << "\n=== Running Configuration Tests ===\n" << std::endl;

    test_load_valid_config();
    test_session_options();
    test_defaults();
    test_invalid_json();
    test_validation_failures();

    std::cout << "\n=== All Tests Passed ===\n" << std::endl;

    return 0;
}
