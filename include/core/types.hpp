#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ActivePref {
namespace Core {

// Reward coefficients over trajectory features, kept at unit L2 norm
using WeightVector = std::vector<double>;

// Answer codes recorded in a preference constraint
constexpr int ANSWER_PREFER_A = 1;
constexpr int ANSWER_PREFER_B = -1;
constexpr int ANSWER_ABOUT_EQUAL = 0;

enum class QueryType {
    Strict,
    Weak
};

enum class Criterion {
    Information,
    Volume,
    Random
};

std::string to_string(QueryType type);
std::string to_string(Criterion criterion);
QueryType parse_query_type(const std::string& name);
Criterion parse_criterion(const std::string& name);

// A trajectory as seen by the learner: an opaque id and its feature vector.
// Controls are only filled in by sources that search control space directly.
struct Trajectory {
    std::string id;
    std::vector<double> features;
    std::vector<double> controls;
};

struct CandidatePair {
    Trajectory a;
    Trajectory b;

    // features(a) - features(b)
    std::vector<double> difference() const;
};

struct Query {
    CandidatePair pair;
    QueryType type = QueryType::Strict;
    size_t index = 0;
};

// Signed feature difference plus the observed answer. Append-only.
struct PreferenceConstraint {
    std::vector<double> delta;
    int answer = ANSWER_PREFER_A;
    std::string a_id;
    std::string b_id;

    // answer * delta; the half-space normal the true weights lie in (strict answers)
    std::vector<double> oriented() const;
};

// Vector helpers
double dot(const std::vector<double>& a, const std::vector<double>& b);
double norm(const std::vector<double>& v);
std::vector<double> normalized(const std::vector<double>& v);
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);
std::string format_vector(const std::vector<double>& v, int precision = 4);

// Feature dimension of a known task domain, 0 if the name is unknown
size_t task_dimension(const std::string& task_name);

// Mixes a base seed with a stream index (splitmix64 finalizer)
uint64_t derive_seed(uint64_t base, uint64_t stream);

// Errors

class DimensionMismatchError : public std::runtime_error {
public:
    DimensionMismatchError(const std::string& what, size_t expected, size_t actual);

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }

private:
    size_t expected_;
    size_t actual_;
};

class DegenerateChainError : public std::runtime_error {
public:
    explicit DegenerateChainError(const std::string& what) : std::runtime_error(what) {}
};

class NoCandidatesError : public std::runtime_error {
public:
    explicit NoCandidatesError(const std::string& what) : std::runtime_error(what) {}
};

class SessionStateError : public std::runtime_error {
public:
    explicit SessionStateError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace Core
} // namespace ActivePref
