#include "model_artifact.hpp"
#include "errors.hpp"

nlohmann::json ModelArtifact::to_json() const {
    if (!classifier) {
        throw StoreError("Artifact has no classifier state");
    }
    return {
        {"format", kArtifactFormat},
        {"format_version", kArtifactFormatVersion},
        {"version", version},
        {"trained_at", trained_at},
        {"schema", schema},
        {"scaler", scaler.to_json()},
        {"classifier", classifier->to_json()}
    };
}

ModelArtifact ModelArtifact::from_json(const nlohmann::json& j) {
    if (!j.is_object() || j.value("format", "") != kArtifactFormat) {
        throw StoreError("Not a model artifact");
    }
    
    ModelArtifact artifact;
    std::shared_ptr<const Classifier> classifier;
    try {
        int format_version = j.at("format_version").get<int>();
        if (format_version != kArtifactFormatVersion) {
            throw StoreError("Unsupported artifact format version " + std::to_string(format_version));
        }
        artifact.version = j.at("version").get<int>();
        artifact.trained_at = j.value("trained_at", "");
        artifact.schema = j.at("schema").get<FeatureSchema>();
        
        if (artifact.schema != canonical_schema()) {
            throw StoreError("Artifact schema does not match the canonical feature schema");
        }
        
        artifact.scaler = ScalingState::from_json(j.at("scaler"));
        classifier = make_classifier(j.at("classifier"));
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(std::string("Invalid model artifact: ") + e.what());
    }
    
    if (artifact.scaler.feature_count() != artifact.schema.size() ||
        classifier->feature_count() != artifact.schema.size()) {
        throw StoreError("Artifact components disagree on feature count");
    }
    artifact.classifier = std::move(classifier);
    
    return artifact;
}
