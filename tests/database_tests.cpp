#include "data/trajectory_database.hpp"
#include "acquisition/feature_store.hpp"
#include "utils/serialization.hpp"
#include "core/types.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

using namespace ActivePref;
namespace fs = std::filesystem;

namespace {

fs::path test_dir() {
    fs::path dir = fs::temp_directory_path() / "activepref_database_tests";
    fs::create_directories(dir);
    return dir;
}

std::string write_file(const std::string& name, const std::string& content) {
    fs::path path = test_dir() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // namespace

void test_load_csv() {
    std::cout << "Testing CSV loading..." << std::endl;

    std::string path = write_file("trajectories.csv",
                                  "id,f1,f2,f3,f4\n"
                                  "# recorded with the driver simulator\n"
                                  "traj-0, 0.1, 0.2, 0.3, 0.4\n"
                                  "\n"
                                  "traj-1,-1.5,2.0,0,1e-3\n"
                                  "traj-2,0.0,0.0,1.0,0.0\n");

    auto db = Data::TrajectoryDatabase::load_csv(path);
    assert(db.dimension() == 4);
    assert(db.num_trajectories() == 3);
    assert(db.trajectories()[1].id == "traj-1");
    assert(db.trajectories()[1].features[0] == -1.5);
    assert(db.trajectories()[1].features[3] == 1e-3);

    bool threw = false;
    try {
        Data::TrajectoryDatabase::load_csv(path, 6);
    } catch (const Core::DimensionMismatchError& e) {
        threw = e.expected() == 6 && e.actual() == 4;
    }
    assert(threw);

    std::string ragged = write_file("ragged.csv", "a,1,2\nb,1,2,3\n");
    threw = false;
    try {
        Data::TrajectoryDatabase::load_csv(ragged);
    } catch (const Core::DimensionMismatchError&) {
        threw = true;
    }
    assert(threw);

    std::string bad = write_file("bad.csv", "a,1,2\nb,1,oops\n");
    threw = false;
    try {
        Data::TrajectoryDatabase::load_csv(bad);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ CSV loading tests passed" << std::endl;
}

void test_build_pairs() {
    std::cout << "Testing candidate pair construction..." << std::endl;

    Data::TrajectoryDatabase db(2);
    for (int i = 0; i < 30; ++i) {
        Core::Trajectory t;
        t.id = "t" + std::to_string(i);
        t.features = {static_cast<double>(i), static_cast<double>(i % 7)};
        db.add_trajectory(t);
    }

    db.build_pairs(1000, 1);
    assert(db.num_pairs() == 30 * 29 / 2);

    db.build_pairs(100, 1);
    assert(db.num_pairs() == 100);
    std::set<std::pair<uint32_t, uint32_t>> unique(db.pair_indices().begin(), db.pair_indices().end());
    assert(unique.size() == 100);
    for (const auto& p : db.pair_indices()) {
        assert(p.first < p.second);
    }

    auto first = db.pair_indices();
    db.build_pairs(100, 1);
    assert(db.pair_indices() == first);

    auto pairs = db.candidate_pairs();
    assert(pairs.size() == 100);
    assert(pairs[0].a.id == db.trajectories()[first[0].first].id);

    bool threw = false;
    try {
        Core::Trajectory wrong;
        wrong.id = "wrong";
        wrong.features = {1.0, 2.0, 3.0};
        db.add_trajectory(wrong);
    } catch (const Core::DimensionMismatchError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Pair construction tests passed" << std::endl;
}

void test_add_from_store() {
    std::cout << "Testing feature store import..." << std::endl;

    Acquisition::TableFeatureStore store(3);
    store.add("left", {1.0, 0.0, 0.0});
    store.add("right", {0.0, 1.0, 0.0});
    assert(store.contains("left"));
    assert(store.size() == 2);

    Data::TrajectoryDatabase db(3);
    db.add_from_store({"left", "right"}, store);
    assert(db.num_trajectories() == 2);
    assert(db.trajectories()[1].features[1] == 1.0);

    bool threw = false;
    try {
        db.add_from_store({"missing"}, store);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Feature store import tests passed" << std::endl;
}

void test_cache_round_trip() {
    std::cout << "Testing database cache..." << std::endl;

    Data::TrajectoryDatabase db(3);
    for (int i = 0; i < 12; ++i) {
        Core::Trajectory t;
        t.id = "traj_" + std::to_string(i);
        t.features = {0.1 * i, -0.37 * i, 1.0 / (i + 1)};
        db.add_trajectory(t);
    }
    db.build_pairs(40, 3);

    std::string path = (test_dir() / "db.cache").string();
    db.save_cache(path);
    assert(Utils::Serialization::validate_checksum(path));

    auto loaded = Data::TrajectoryDatabase::load_cache(path);
    assert(loaded.dimension() == 3);
    assert(loaded.num_trajectories() == 12);
    assert(loaded.pair_indices() == db.pair_indices());
    for (size_t i = 0; i < 12; ++i) {
        assert(loaded.trajectories()[i].id == db.trajectories()[i].id);
        assert(loaded.trajectories()[i].features == db.trajectories()[i].features);
    }

    // Flip one payload byte
    {
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        file.seekg(20);
        char byte = 0;
        file.read(&byte, 1);
        byte ^= 0x5A;
        file.seekp(20);
        file.write(&byte, 1);
    }
    bool threw = false;
    try {
        Data::TrajectoryDatabase::load_cache(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Database cache tests passed" << std::endl;
}

int main() {
    std::cout << "\n=== Running Trajectory Database Tests ===\n" << std::endl;

    test_load_csv();
    test_build_pairs();
    test_add_from_store();
    test_cache_round_trip();

    fs::remove_all(test_dir());

    std::cout << "\n=== All Tests Passed ===\n" << std::endl;

    return 0;
}
