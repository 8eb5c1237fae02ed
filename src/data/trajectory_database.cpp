#include "data/trajectory_database.hpp"
#include "utils/logger.hpp"
#include "utils/serialization.hpp"
#include <cmath>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace ActivePref {
namespace Data {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    return fields;
}

bool parse_number(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        value = std::stod(text, &consumed);
        return consumed == text.size() && std::isfinite(value);
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

TrajectoryDatabase::TrajectoryDatabase(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("Trajectory database dimension must be positive");
    }
}

void TrajectoryDatabase::add_trajectory(Core::Trajectory trajectory) {
    if (trajectory.features.size() != dimension_) {
        throw Core::DimensionMismatchError("Trajectory '" + trajectory.id + "' has wrong feature count",
                                           dimension_, trajectory.features.size());
    }
    trajectories_.push_back(std::move(trajectory));
}

void TrajectoryDatabase::add_from_store(const std::vector<std::string>& ids,
                                        const Acquisition::FeatureStore& store) {
    if (store.dimension() != dimension_) {
        throw Core::DimensionMismatchError("Feature store dimension does not match database",
                                           dimension_, store.dimension());
    }
    for (const auto& id : ids) {
        Core::Trajectory trajectory;
        trajectory.id = id;
        trajectory.features = store.features(trajectory);
        add_trajectory(std::move(trajectory));
    }
}

void TrajectoryDatabase::build_pairs(size_t max_pairs, uint64_t seed) {
    Utils::ModuleLogger logger("DATABASE");
    pairs_.clear();

    const size_t n = trajectories_.size();
    if (n < 2 || max_pairs == 0) {
        logger.warning("Not enough trajectories to build candidate pairs (" + std::to_string(n) + ")");
        return;
    }

    const size_t total = n * (n - 1) / 2;
    if (total <= max_pairs) {
        pairs_.reserve(total);
        for (size_t i = 0; i < n; ++i) {
            for (size_t j = i + 1; j < n; ++j) {
                pairs_.emplace_back(static_cast<uint32_t>(i), static_cast<uint32_t>(j));
            }
        }
        logger.info("Enumerated all " + std::to_string(total) + " candidate pairs");
        return;
    }

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> pick(0, n - 1);
    std::unordered_set<uint64_t> seen;
    pairs_.reserve(max_pairs);
    while (pairs_.size() < max_pairs) {
        size_t i = pick(rng);
        size_t j = pick(rng);
        if (i == j) {
            continue;
        }
        if (i > j) {
            std::swap(i, j);
        }
        uint64_t key = (static_cast<uint64_t>(i) << 32) | static_cast<uint64_t>(j);
        if (seen.insert(key).second) {
            pairs_.emplace_back(static_cast<uint32_t>(i), static_cast<uint32_t>(j));
        }
    }
    logger.info("Sampled " + std::to_string(max_pairs) + " of " + std::to_string(total) +
                " possible candidate pairs");
}

std::vector<Core::CandidatePair> TrajectoryDatabase::candidate_pairs() const {
    std::vector<Core::CandidatePair> out;
    out.reserve(pairs_.size());
    for (const auto& p : pairs_) {
        out.push_back({trajectories_[p.first], trajectories_[p.second]});
    }
    return out;
}

TrajectoryDatabase TrajectoryDatabase::load_csv(const std::string& filepath, size_t expected_dimension) {
    Utils::ModuleLogger logger("DATABASE");

    std::ifstream file(filepath);
    if (!file.is_open()) {
        logger.error("Failed to open trajectory file: " + filepath);
        throw std::runtime_error("Cannot open trajectory file: " + filepath);
    }

    std::vector<Core::Trajectory> rows;
    size_t dimension = expected_dimension;
    bool first_data_line = true;
    std::string line;
    size_t line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        auto fields = split_csv(trimmed);
        if (fields.size() < 2) {
            throw std::runtime_error(filepath + ":" + std::to_string(line_number) +
                                     ": expected id followed by features");
        }

        Core::Trajectory trajectory;
        trajectory.id = fields[0];
        bool numeric = true;
        for (size_t i = 1; i < fields.size(); ++i) {
            double value = 0.0;
            if (!parse_number(fields[i], value)) {
                numeric = false;
                break;
            }
            trajectory.features.push_back(value);
        }

        if (!numeric) {
            if (first_data_line) {
                first_data_line = false;
                continue;   // header
            }
            throw std::runtime_error(filepath + ":" + std::to_string(line_number) +
                                     ": non-numeric feature value");
        }
        first_data_line = false;

        if (dimension == 0) {
            dimension = trajectory.features.size();
        }
        if (trajectory.features.size() != dimension) {
            throw Core::DimensionMismatchError(filepath + ":" + std::to_string(line_number) +
                                               ": wrong number of features",
                                               dimension, trajectory.features.size());
        }
        rows.push_back(std::move(trajectory));
    }

    if (rows.empty()) {
        throw std::runtime_error("No trajectories found in " + filepath);
    }

    TrajectoryDatabase db(dimension);
    for (auto& row : rows) {
        db.add_trajectory(std::move(row));
    }
    logger.info("Loaded " + std::to_string(db.num_trajectories()) + " trajectories with " +
                std::to_string(dimension) + " features from " + filepath);
    return db;
}

void TrajectoryDatabase::save_cache(const std::string& filepath) const {
    Utils::ModuleLogger logger("DATABASE");
    {
        std::ofstream out(filepath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Cannot open cache file for writing: " + filepath);
        }

        Utils::Serialization::write_header(out);
        Utils::Serialization::write_u32(out, static_cast<uint32_t>(dimension_));
        Utils::Serialization::write_u32(out, static_cast<uint32_t>(trajectories_.size()));
        for (const auto& trajectory : trajectories_) {
            Utils::Serialization::write_string(out, trajectory.id);
            Utils::Serialization::write_vector(out, trajectory.features);
        }
        Utils::Serialization::write_u32(out, static_cast<uint32_t>(pairs_.size()));
        for (const auto& p : pairs_) {
            Utils::Serialization::write_u32(out, p.first);
            Utils::Serialization::write_u32(out, p.second);
        }
    }
    Utils::Serialization::append_checksum(filepath);

    logger.info("Saved database cache (" + std::to_string(trajectories_.size()) + " trajectories, " +
                std::to_string(pairs_.size()) + " pairs) to " + filepath);
}

TrajectoryDatabase TrajectoryDatabase::load_cache(const std::string& filepath) {
    Utils::ModuleLogger logger("DATABASE");

    if (!Utils::Serialization::validate_checksum(filepath)) {
        logger.error("Checksum mismatch in database cache: " + filepath);
        throw std::runtime_error("Corrupt database cache: " + filepath);
    }

    std::ifstream in(filepath, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open cache file: " + filepath);
    }

    Utils::Serialization::read_header(in);
    uint32_t dimension = Utils::Serialization::read_u32(in);
    uint32_t count = Utils::Serialization::read_u32(in);

    TrajectoryDatabase db(dimension);
    db.trajectories_.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        Core::Trajectory trajectory;
        trajectory.id = Utils::Serialization::read_string(in);
        trajectory.features = Utils::Serialization::read_vector(in, dimension);
        db.trajectories_.push_back(std::move(trajectory));
    }

    uint32_t num_pairs = Utils::Serialization::read_u32(in);
    db.pairs_.reserve(num_pairs);
    for (uint32_t i = 0; i < num_pairs; ++i) {
        uint32_t a = Utils::Serialization::read_u32(in);
        uint32_t b = Utils::Serialization::read_u32(in);
        if (a >= count || b >= count || a == b) {
            throw std::runtime_error("Invalid pair index in database cache: " + filepath);
        }
        db.pairs_.emplace_back(a, b);
    }

    logger.info("Loaded database cache (" + std::to_string(count) + " trajectories, " +
                std::to_string(num_pairs) + " pairs) from " + filepath);
    return db;
}

} // namespace Data
} // namespace ActivePref
