#pragma once

#include "scaler.hpp"
#include <array>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Binary classifier capability. Class 0 = away win, class 1 = home win.
class Classifier {
public:
    virtual ~Classifier() = default;
    
    // cancel may be null; implementations poll it and throw TrainingCancelled
    virtual void fit(const Matrix& X, const std::vector<int>& y,
                     const std::atomic<bool>* cancel) = 0;
    
    virtual std::array<double, 2> predict_proba(const Row& x) const = 0;
    
    // One non-negative score per input column, in column order
    virtual std::vector<double> feature_importances() const = 0;
    
    virtual size_t feature_count() const = 0;
    virtual std::string kind() const = 0;
    virtual nlohmann::json to_json() const = 0;
};

// Restores a persisted classifier by its "kind" tag. Throws StoreError.
std::unique_ptr<Classifier> make_classifier(const nlohmann::json& state);
