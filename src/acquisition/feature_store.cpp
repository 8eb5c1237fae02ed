#include "acquisition/feature_store.hpp"
#include <stdexcept>
#include <utility>

namespace ActivePref {
namespace Acquisition {

TableFeatureStore::TableFeatureStore(size_t dimension) : dimension_(dimension) {
    if (dimension_ == 0) {
        throw std::invalid_argument("Feature dimension must be positive");
    }
}

void TableFeatureStore::add(const std::string& id, std::vector<double> features) {
    if (features.size() != dimension_) {
        throw Core::DimensionMismatchError("Feature vector for '" + id + "' has wrong size",
                                           dimension_, features.size());
    }
    table_[id] = std::move(features);
}

bool TableFeatureStore::contains(const std::string& id) const {
    return table_.find(id) != table_.end();
}

std::vector<double> TableFeatureStore::features(const Core::Trajectory& trajectory) const {
    auto it = table_.find(trajectory.id);
    if (it == table_.end()) {
        throw std::out_of_range("No features stored for trajectory: " + trajectory.id);
    }
    return it->second;
}

} // namespace Acquisition
} // namespace ActivePref
