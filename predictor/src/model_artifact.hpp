#pragma once

#include "classifier.hpp"
#include "feature_vector.hpp"
#include "scaler.hpp"
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

constexpr const char* kArtifactFormat = "gamepredict.model";
constexpr int kArtifactFormatVersion = 1;

// Classifier, scaler and schema always travel together. Immutable once built.
struct ModelArtifact {
    int version = 0;
    std::string trained_at;
    FeatureSchema schema;
    ScalingState scaler;
    std::shared_ptr<const Classifier> classifier;
    
    nlohmann::json to_json() const;
    
    // Validates format, lengths and schema against canonical_schema(). Throws StoreError.
    static ModelArtifact from_json(const nlohmann::json& j);
};
