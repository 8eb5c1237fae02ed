#pragma once

#include "core/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace ActivePref {
namespace Acquisition {

// Maps a trajectory to its fixed-length feature vector.
// Implemented by the simulation side; the learner only reads features.
class FeatureStore {
public:
    virtual ~FeatureStore() = default;

    virtual size_t dimension() const = 0;
    virtual std::vector<double> features(const Core::Trajectory& trajectory) const = 0;
};

// In-memory table of precomputed features keyed by trajectory id
class TableFeatureStore : public FeatureStore {
public:
    explicit TableFeatureStore(size_t dimension);

    void add(const std::string& id, std::vector<double> features);
    bool contains(const std::string& id) const;
    size_t size() const { return table_.size(); }

    size_t dimension() const override { return dimension_; }

    // Throws std::out_of_range for unknown ids
    std::vector<double> features(const Core::Trajectory& trajectory) const override;

private:
    size_t dimension_;
    std::unordered_map<std::string, std::vector<double>> table_;
};

// Simulator that rolls out a control vector and reports its features.
// Used by the continuous candidate source to search control space directly.
class ControlFeatureModel {
public:
    virtual ~ControlFeatureModel() = default;

    virtual size_t dimension() const = 0;
    virtual size_t control_dimension() const = 0;
    virtual std::vector<double> lower_bounds() const = 0;
    virtual std::vector<double> upper_bounds() const = 0;
    virtual std::vector<double> features(const std::vector<double>& controls) const = 0;
};

} // namespace Acquisition
} // namespace ActivePref
