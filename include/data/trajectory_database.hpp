#pragma once

#include "acquisition/feature_store.hpp"
#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ActivePref {
namespace Data {

/**
 * Precomputed trajectory set and the candidate pairs drawn from it.
 *
 * Features are extracted once at preprocessing time and cached in a binary
 * file so that sessions never touch the simulator:
 *   [magic "APREF"][version][dimension][n][n x (id, features)]
 *   [pairs][pairs x (index a, index b)][crc32]
 */
class TrajectoryDatabase {
public:
    explicit TrajectoryDatabase(size_t dimension);

    size_t dimension() const { return dimension_; }
    size_t num_trajectories() const { return trajectories_.size(); }
    size_t num_pairs() const { return pairs_.size(); }

    const std::vector<Core::Trajectory>& trajectories() const { return trajectories_; }
    const std::vector<std::pair<uint32_t, uint32_t>>& pair_indices() const { return pairs_; }

    void add_trajectory(Core::Trajectory trajectory);

    /**
     * Pre-score trajectory ids against a feature store
     * @throws std::out_of_range if the store lacks an id
     */
    void add_from_store(const std::vector<std::string>& ids, const Acquisition::FeatureStore& store);

    /**
     * Build candidate pairs
     * Every unordered pair when n(n-1)/2 <= max_pairs, otherwise max_pairs
     * distinct random pairs (deterministic for the seed)
     */
    void build_pairs(size_t max_pairs, uint64_t seed);

    // Materialize the candidate pairs
    std::vector<Core::CandidatePair> candidate_pairs() const;

    /**
     * Load trajectories from text: one "id,f1,...,fD" row per line.
     * Blank lines and lines starting with '#' are skipped, as is a first
     * line whose feature columns are not numeric (header).
     */
    static TrajectoryDatabase load_csv(const std::string& filepath, size_t expected_dimension = 0);

    void save_cache(const std::string& filepath) const;
    static TrajectoryDatabase load_cache(const std::string& filepath);

private:
    size_t dimension_;
    std::vector<Core::Trajectory> trajectories_;
    std::vector<std::pair<uint32_t, uint32_t>> pairs_;
};

} // namespace Data
} // namespace ActivePref
