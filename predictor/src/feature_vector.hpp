#pragma once

#include "game_record.hpp"
#include <array>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

constexpr size_t kFeatureCount = 18;

using FeatureSchema = std::vector<std::string>;

// Canonical feature order. Persisted models are bound to this exact sequence.
const FeatureSchema& canonical_schema();

class FeatureVector {
public:
    using Values = std::array<double, kFeatureCount>;
    
    FeatureVector() { values_.fill(0.0); }
    explicit FeatureVector(const Values& values) : values_(values) {}
    
    const Values& values() const { return values_; }
    double operator[](size_t i) const { return values_[i]; }
    double get(const std::string& name) const;
    size_t size() const { return values_.size(); }
    
    nlohmann::json to_json() const;
    
    // Accepts {name: number} with every schema name present. Throws DataContractError.
    static FeatureVector from_json(const nlohmann::json& named);
    
private:
    Values values_;
};

struct TrainingDataset {
    std::vector<FeatureVector> features;
    std::vector<int> labels;   // 1 = home team won
    
    void add(const FeatureVector& fv, int label);
    size_t size() const { return features.size(); }
    bool empty() const { return features.empty(); }
};

class FeatureVectorBuilder {
public:
    // Plays per game is not tracked upstream; yards per play is approximated.
    static constexpr double kApproxPlaysPerGame = 60.0;
    static constexpr double kDefaultRestDays = 7.0;
    
    explicit FeatureVectorBuilder(int window_size = 5);
    
    FeatureVector build(const GameRecord& game,
                        const std::vector<GameRecord>& historical_games) const;
    
    // Each game is featurised against the games that precede it.
    TrainingDataset build_training_dataset(const std::vector<GameRecord>& games) const;
    
private:
    int window_size_;
    
    FeatureVector build_from(const GameRecord& game,
                             const std::vector<GameRecord>& games,
                             size_t history_len) const;
};
