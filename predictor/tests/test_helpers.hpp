#pragma once

#include "../src/feature_vector.hpp"
#include "../src/game_record.hpp"
#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace test_helpers {

inline GameRecord make_game(const std::string& home, const std::string& away,
                            double home_score, double away_score) {
    GameRecord g;
    g.home.id = home;
    g.away.id = away;
    g.home.score = home_score;
    g.away.score = away_score;
    g.winner = home_score > away_score ? Winner::Home : Winner::Away;
    return g;
}

// label = 1 exactly when home_win_rate > 0.5; other columns carry unrelated patterns
inline TrainingDataset threshold_dataset(size_t n) {
    TrainingDataset ds;
    for (size_t i = 0; i < n; ++i) {
        FeatureVector::Values v;
        v.fill(0.0);
        v[0] = static_cast<double>(i % 10) / 10.0;
        v[1] = static_cast<double>((i * 3) % 7) / 7.0;
        v[2] = 20.0 + static_cast<double>((i * 5) % 11);
        v[16] = 7.0;
        v[17] = 7.0;
        ds.add(FeatureVector(v), v[0] > 0.5 ? 1 : 0);
    }
    return ds;
}

inline TrainingDataset single_class_dataset(size_t n, int label) {
    TrainingDataset ds;
    for (size_t i = 0; i < n; ++i) {
        FeatureVector::Values v;
        v.fill(static_cast<double>(i));
        ds.add(FeatureVector(v), label);
    }
    return ds;
}

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("gamepredict_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    
    std::string file(const std::string& name) const { return (path_ / name).string(); }
    const std::filesystem::path& path() const { return path_; }
    
private:
    std::filesystem::path path_;
};

} // namespace test_helpers
