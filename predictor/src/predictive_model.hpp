#pragma once

#include "classifier.hpp"
#include "feature_vector.hpp"
#include "gradient_boosting.hpp"
#include "metrics.hpp"
#include "model_artifact.hpp"
#include "model_store.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

enum class ModelState {
    Untrained,
    Ready,
    Training
};

std::string model_state_string(ModelState state);

struct TrainingOptions {
    double test_fraction = 0.2;
    uint32_t split_seed = 42;
    GradientBoostingParams boosting;
};

struct PredictionResult {
    double home_win_probability;
    double away_win_probability;
    std::string predicted_winner;   // "home" or "away"
    double confidence;              // max of the two probabilities
    int model_version;
    
    nlohmann::json to_json() const;
};

// Ordered like the schema
using FeatureImportances = std::vector<std::pair<std::string, double>>;

nlohmann::json importances_to_json(const FeatureImportances& importances);

struct Explanation {
    PredictionResult prediction;
    FeatureImportances importances;
};

// Owns the active ModelArtifact. Readers take a snapshot; train/reload swap
// the pointer under a short lock so a reader never sees a partial artifact.
class PredictiveModel {
public:
    using ClassifierFactory = std::function<std::unique_ptr<Classifier>()>;
    
    explicit PredictiveModel(std::shared_ptr<ModelStore> store,
                             const TrainingOptions& options = TrainingOptions(),
                             ClassifierFactory factory = nullptr);
    
    // Not re-entrant. Throws TrainingError (incl. InsufficientDataError,
    // TrainingCancelled); the previous artifact stays active on failure.
    TrainingMetrics train(const TrainingDataset& dataset,
                          const std::atomic<bool>* cancel = nullptr);
    
    // Loads from the store on first use. Throws NotReadyError.
    PredictionResult predict(const FeatureVector& features);
    
    // Prediction and importances taken from the same artifact
    Explanation explain(const FeatureVector& features);
    
    // Throws NotReadyError when no artifact is held
    FeatureImportances feature_importances() const;
    
    void persist();
    // false when the store holds nothing; the in-memory artifact is kept
    bool reload();
    
    ModelState state() const;
    bool is_ready() const;
    std::shared_ptr<const ModelArtifact> snapshot() const;
    std::string model_type() const;
    
private:
    std::shared_ptr<ModelStore> store_;
    TrainingOptions options_;
    ClassifierFactory factory_;
    
    mutable std::mutex mutex_;
    std::shared_ptr<const ModelArtifact> artifact_;
    
    std::mutex load_mutex_;
    std::atomic<bool> training_{false};
    
    void swap_in(std::shared_ptr<const ModelArtifact> next);
    std::shared_ptr<const ModelArtifact> acquire_or_load();
    
    std::pair<std::vector<size_t>, std::vector<size_t>> split_indices(size_t n) const;
};
