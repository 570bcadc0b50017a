#include "scaler.hpp"
#include "errors.hpp"
#include <cmath>
#include <stdexcept>

ScalingState ScalingState::fit(const Matrix& rows) {
    if (rows.empty()) {
        throw std::invalid_argument("Cannot fit scaler on an empty matrix");
    }
    
    size_t n_features = rows.front().size();
    double n = static_cast<double>(rows.size());
    
    ScalingState state;
    state.mean_.assign(n_features, 0.0);
    state.scale_.assign(n_features, 0.0);
    
    for (const auto& row : rows) {
        if (row.size() != n_features) {
            throw std::invalid_argument("Ragged feature matrix");
        }
        for (size_t j = 0; j < n_features; ++j) {
            state.mean_[j] += row[j];
        }
    }
    for (auto& m : state.mean_) m /= n;
    
    // Population variance
    for (const auto& row : rows) {
        for (size_t j = 0; j < n_features; ++j) {
            double d = row[j] - state.mean_[j];
            state.scale_[j] += d * d;
        }
    }
    for (auto& s : state.scale_) {
        s = std::sqrt(s / n);
        // Constant columns pass through centred but unscaled
        if (s < 1e-12) s = 1.0;
    }
    
    return state;
}

Row ScalingState::transform(const Row& row) const {
    if (row.size() != mean_.size()) {
        throw DataContractError("Expected " + std::to_string(mean_.size()) +
                                " features, got " + std::to_string(row.size()));
    }
    Row out(row.size());
    for (size_t j = 0; j < row.size(); ++j) {
        out[j] = (row[j] - mean_[j]) / scale_[j];
    }
    return out;
}

Row ScalingState::transform(const FeatureVector& fv) const {
    return transform(Row(fv.values().begin(), fv.values().end()));
}

Matrix ScalingState::transform(const Matrix& rows) const {
    Matrix out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        out.push_back(transform(row));
    }
    return out;
}

nlohmann::json ScalingState::to_json() const {
    return {
        {"mean", mean_},
        {"scale", scale_}
    };
}

ScalingState ScalingState::from_json(const nlohmann::json& j) {
    ScalingState state;
    try {
        state.mean_ = j.at("mean").get<std::vector<double>>();
        state.scale_ = j.at("scale").get<std::vector<double>>();
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(std::string("Invalid scaler state: ") + e.what());
    }
    if (state.mean_.size() != state.scale_.size()) {
        throw StoreError("Scaler mean/scale length mismatch");
    }
    for (double s : state.scale_) {
        if (!(s > 0.0)) throw StoreError("Scaler scale must be positive");
    }
    return state;
}
