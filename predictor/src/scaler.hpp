#pragma once

#include "feature_vector.hpp"
#include <vector>
#include <nlohmann/json.hpp>

using Row = std::vector<double>;
using Matrix = std::vector<Row>;

// Per-feature standardisation: (x - mean) / scale. Fit once on training rows.
class ScalingState {
public:
    ScalingState() = default;
    
    static ScalingState fit(const Matrix& rows);
    
    Row transform(const Row& row) const;
    Row transform(const FeatureVector& fv) const;
    Matrix transform(const Matrix& rows) const;
    
    const std::vector<double>& mean() const { return mean_; }
    const std::vector<double>& scale() const { return scale_; }
    size_t feature_count() const { return mean_.size(); }
    
    nlohmann::json to_json() const;
    static ScalingState from_json(const nlohmann::json& j);
    
private:
    std::vector<double> mean_;
    std::vector<double> scale_;
};
