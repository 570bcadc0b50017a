#include "predictive_model.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace {

// Clears the training flag on every exit path
class TrainingGuard {
public:
    explicit TrainingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~TrainingGuard() { flag_ = false; }
    
    TrainingGuard(const TrainingGuard&) = delete;
    TrainingGuard& operator=(const TrainingGuard&) = delete;
    
private:
    std::atomic<bool>& flag_;
};

bool single_class(const std::vector<int>& labels) {
    return std::all_of(labels.begin(), labels.end(),
                       [&](int l) { return l == labels.front(); });
}

void check_schema(const ModelArtifact& artifact) {
    if (artifact.schema != canonical_schema()) {
        throw DataContractError("Active model was trained on a different feature schema");
    }
}

PredictionResult predict_with(const ModelArtifact& artifact, const FeatureVector& features) {
    check_schema(artifact);
    
    Row scaled = artifact.scaler.transform(features);
    auto proba = artifact.classifier->predict_proba(scaled);
    
    double total = proba[0] + proba[1];
    if (!(total > 0.0) || !std::isfinite(total)) {
        throw PredictorError("Classifier returned invalid probabilities");
    }
    
    PredictionResult result;
    result.home_win_probability = proba[1] / total;
    result.away_win_probability = 1.0 - result.home_win_probability;
    result.predicted_winner = result.home_win_probability > result.away_win_probability ? "home" : "away";
    result.confidence = std::max(result.home_win_probability, result.away_win_probability);
    result.model_version = artifact.version;
    
    spdlog::debug("Prediction v{}: home={:.4f} away={:.4f}", artifact.version,
                  result.home_win_probability, result.away_win_probability);
    return result;
}

FeatureImportances importances_of(const ModelArtifact& artifact) {
    auto scores = artifact.classifier->feature_importances();
    if (scores.size() != artifact.schema.size()) {
        throw PredictorError("Classifier reported " + std::to_string(scores.size()) +
                             " importances for " + std::to_string(artifact.schema.size()) +
                             " features");
    }
    
    FeatureImportances out;
    out.reserve(scores.size());
    for (size_t i = 0; i < scores.size(); ++i) {
        out.emplace_back(artifact.schema[i], std::max(0.0, scores[i]));
    }
    return out;
}

} // namespace

std::string model_state_string(ModelState state) {
    switch (state) {
        case ModelState::Ready: return "ready";
        case ModelState::Training: return "training";
        default: return "untrained";
    }
}

nlohmann::json PredictionResult::to_json() const {
    return {
        {"home_team_win_probability", home_win_probability},
        {"away_team_win_probability", away_win_probability},
        {"predicted_winner", predicted_winner},
        {"confidence", confidence},
        {"model_version", model_version}
    };
}

nlohmann::json importances_to_json(const FeatureImportances& importances) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, score] : importances) {
        out[name] = score;
    }
    return out;
}

PredictiveModel::PredictiveModel(std::shared_ptr<ModelStore> store,
                                 const TrainingOptions& options,
                                 ClassifierFactory factory)
    : store_(std::move(store)), options_(options), factory_(std::move(factory)) {
    if (!store_) {
        throw std::invalid_argument("PredictiveModel requires a model store");
    }
    if (options_.test_fraction <= 0.0 || options_.test_fraction >= 1.0) {
        throw std::invalid_argument("test_fraction must be in (0, 1)");
    }
    if (!factory_) {
        GradientBoostingParams params = options_.boosting;
        factory_ = [params]() { return std::make_unique<GradientBoostingClassifier>(params); };
    }
}

std::pair<std::vector<size_t>, std::vector<size_t>>
PredictiveModel::split_indices(size_t n) const {
    size_t n_test = static_cast<size_t>(std::ceil(options_.test_fraction * static_cast<double>(n)));
    size_t n_train = n - std::min(n_test, n);
    if (n_train == 0 || n_test == 0) {
        throw InsufficientDataError("Dataset of " + std::to_string(n) +
                                    " examples is too small for a train/test split");
    }
    
    // Fisher-Yates on mt19937 so the split is identical for a given seed
    std::vector<size_t> perm(n);
    std::iota(perm.begin(), perm.end(), 0);
    std::mt19937 rng(options_.split_seed);
    for (size_t i = n - 1; i > 0; --i) {
        size_t j = static_cast<size_t>(rng() % (i + 1));
        std::swap(perm[i], perm[j]);
    }
    
    std::vector<size_t> test(perm.begin(), perm.begin() + static_cast<std::ptrdiff_t>(n_test));
    std::vector<size_t> train(perm.begin() + static_cast<std::ptrdiff_t>(n_test), perm.end());
    return {train, test};
}

TrainingMetrics PredictiveModel::train(const TrainingDataset& dataset,
                                       const std::atomic<bool>* cancel) {
    if (training_.exchange(true)) {
        throw TrainingError("Training already in progress");
    }
    TrainingGuard guard(training_);
    
    if (dataset.empty()) {
        throw InsufficientDataError("Training requires at least one labeled example");
    }
    if (dataset.features.size() != dataset.labels.size()) {
        throw TrainingError("Feature and label counts differ");
    }
    if (single_class(dataset.labels)) {
        throw InsufficientDataError("Training labels contain a single class (all " +
                                    std::to_string(dataset.labels.front()) + ")");
    }
    
    spdlog::info("Training on {} examples", dataset.size());
    
    auto [train_idx, test_idx] = split_indices(dataset.size());
    
    Matrix X_train, X_test;
    std::vector<int> y_train, y_test;
    for (size_t i : train_idx) {
        const auto& v = dataset.features[i].values();
        X_train.emplace_back(v.begin(), v.end());
        y_train.push_back(dataset.labels[i]);
    }
    for (size_t i : test_idx) {
        const auto& v = dataset.features[i].values();
        X_test.emplace_back(v.begin(), v.end());
        y_test.push_back(dataset.labels[i]);
    }
    
    if (single_class(y_train)) {
        throw InsufficientDataError("Train partition contains a single class");
    }
    spdlog::info("Split: train={}, test={}", X_train.size(), X_test.size());
    
    // Fit on the train partition only
    ScalingState scaler = ScalingState::fit(X_train);
    Matrix X_train_scaled = scaler.transform(X_train);
    Matrix X_test_scaled = scaler.transform(X_test);
    
    std::unique_ptr<Classifier> classifier = factory_();
    classifier->fit(X_train_scaled, y_train, cancel);
    
    if (classifier->feature_importances().size() != kFeatureCount ||
        classifier->feature_count() != kFeatureCount) {
        throw TrainingError("Classifier output does not align with the feature schema");
    }
    
    std::vector<int> y_pred;
    y_pred.reserve(X_test_scaled.size());
    for (const auto& row : X_test_scaled) {
        auto proba = classifier->predict_proba(row);
        y_pred.push_back(proba[1] > proba[0] ? 1 : 0);
    }
    
    if (cancel && cancel->load()) {
        throw TrainingCancelled();
    }
    
    auto previous = snapshot();
    auto next = std::make_shared<ModelArtifact>();
    next->version = (previous ? previous->version : 0) + 1;
    next->trained_at = util::current_iso8601();
    next->schema = canonical_schema();
    next->scaler = std::move(scaler);
    next->classifier = std::shared_ptr<const Classifier>(std::move(classifier));
    
    TrainingMetrics metrics;
    metrics.accuracy = MetricsCalculator::accuracy(y_test, y_pred);
    metrics.report = MetricsCalculator::classification_report(y_test, y_pred);
    metrics.train_size = X_train.size();
    metrics.test_size = X_test.size();
    metrics.model_version = next->version;
    metrics.trained_at = next->trained_at;
    
    swap_in(next);
    spdlog::info("Model v{} trained, accuracy={:.3f}", next->version, metrics.accuracy);
    
    // In-memory artifact stays authoritative if the write fails
    try {
        store_->save(*next);
        metrics.persisted = true;
    } catch (const StoreError& e) {
        metrics.persist_error = e.what();
        spdlog::error("Model v{} not persisted: {}", next->version, e.what());
    }
    
    return metrics;
}

void PredictiveModel::swap_in(std::shared_ptr<const ModelArtifact> next) {
    std::lock_guard<std::mutex> lock(mutex_);
    artifact_ = std::move(next);
}

std::shared_ptr<const ModelArtifact> PredictiveModel::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return artifact_;
}

std::shared_ptr<const ModelArtifact> PredictiveModel::acquire_or_load() {
    auto current = snapshot();
    if (current) return current;
    
    std::lock_guard<std::mutex> load_lock(load_mutex_);
    current = snapshot();
    if (current) return current;
    
    std::optional<ModelArtifact> loaded;
    try {
        loaded = store_->load();
    } catch (const StoreError& e) {
        throw NotReadyError(std::string("Model could not be loaded: ") + e.what());
    }
    if (!loaded) {
        throw NotReadyError("No trained model available (" + store_->describe() + ")");
    }
    
    current = std::make_shared<const ModelArtifact>(std::move(*loaded));
    swap_in(current);
    return current;
}

PredictionResult PredictiveModel::predict(const FeatureVector& features) {
    auto artifact = acquire_or_load();
    return predict_with(*artifact, features);
}

Explanation PredictiveModel::explain(const FeatureVector& features) {
    auto artifact = acquire_or_load();
    return {predict_with(*artifact, features), importances_of(*artifact)};
}

FeatureImportances PredictiveModel::feature_importances() const {
    auto artifact = snapshot();
    if (!artifact) {
        throw NotReadyError("Model not trained or loaded");
    }
    return importances_of(*artifact);
}

void PredictiveModel::persist() {
    auto artifact = snapshot();
    if (!artifact) {
        throw NotReadyError("No model to persist");
    }
    store_->save(*artifact);
}

bool PredictiveModel::reload() {
    auto loaded = store_->load();
    if (!loaded) {
        spdlog::warn("Reload requested but {} holds no model", store_->describe());
        return false;
    }
    
    int version = loaded->version;
    swap_in(std::make_shared<const ModelArtifact>(std::move(*loaded)));
    spdlog::info("Model v{} reloaded from {}", version, store_->describe());
    return true;
}

ModelState PredictiveModel::state() const {
    if (training_) return ModelState::Training;
    return snapshot() ? ModelState::Ready : ModelState::Untrained;
}

bool PredictiveModel::is_ready() const {
    return snapshot() != nullptr;
}

std::string PredictiveModel::model_type() const {
    auto artifact = snapshot();
    return artifact ? artifact->classifier->kind() : factory_()->kind();
}
