#include "core/types.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace ActivePref {
namespace Core {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void check_same_size(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError("Vector dimension mismatch", a.size(), b.size());
    }
}

} // namespace

std::string to_string(QueryType type) {
    switch (type) {
        case QueryType::Strict: return "strict";
        case QueryType::Weak: return "weak";
    }
    return "unknown";
}

std::string to_string(Criterion criterion) {
    switch (criterion) {
        case Criterion::Information: return "information";
        case Criterion::Volume: return "volume";
        case Criterion::Random: return "random";
    }
    return "unknown";
}

QueryType parse_query_type(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "strict") return QueryType::Strict;
    if (lower == "weak") return QueryType::Weak;
    throw std::invalid_argument("Query type must be \"strict\" or \"weak\", got: " + name);
}

Criterion parse_criterion(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "information") return Criterion::Information;
    if (lower == "volume") return Criterion::Volume;
    if (lower == "random") return Criterion::Random;
    throw std::invalid_argument("There is no criterion called " + name);
}

std::vector<double> CandidatePair::difference() const {
    check_same_size(a.features, b.features);
    std::vector<double> diff(a.features.size());
    for (size_t i = 0; i < diff.size(); ++i) {
        diff[i] = a.features[i] - b.features[i];
    }
    return diff;
}

std::vector<double> PreferenceConstraint::oriented() const {
    std::vector<double> out(delta.size());
    for (size_t i = 0; i < delta.size(); ++i) {
        out[i] = static_cast<double>(answer) * delta[i];
    }
    return out;
}

double dot(const std::vector<double>& a, const std::vector<double>& b) {
    check_same_size(a, b);
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

double norm(const std::vector<double>& v) {
    double sum = 0.0;
    for (double x : v) {
        sum += x * x;
    }
    return std::sqrt(sum);
}

std::vector<double> normalized(const std::vector<double>& v) {
    double n = norm(v);
    if (!(n > 0.0) || !std::isfinite(n)) {
        throw std::invalid_argument("Cannot normalize a zero or non-finite vector");
    }
    std::vector<double> out(v.size());
    for (size_t i = 0; i < v.size(); ++i) {
        out[i] = v[i] / n;
    }
    return out;
}

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    double na = norm(a);
    double nb = norm(b);
    if (na == 0.0 || nb == 0.0) {
        return 0.0;
    }
    return dot(a, b) / (na * nb);
}

std::string format_vector(const std::vector<double>& v, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << "[";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << v[i];
    }
    oss << "]";
    return oss.str();
}

size_t task_dimension(const std::string& task_name) {
    std::string lower = to_lower(task_name);
    if (lower == "driver" || lower == "tosser") return 4;
    if (lower == "lunarlander") return 6;
    return 0;
}

uint64_t derive_seed(uint64_t base, uint64_t stream) {
    uint64_t z = base + 0x9E3779B97F4A7C15ULL * (stream + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

DimensionMismatchError::DimensionMismatchError(const std::string& what, size_t expected, size_t actual)
    : std::runtime_error(what + " (expected " + std::to_string(expected) +
                         ", got " + std::to_string(actual) + ")"),
      expected_(expected), actual_(actual) {}

} // namespace Core
} // namespace ActivePref
