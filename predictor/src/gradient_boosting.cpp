#include "gradient_boosting.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace {

double sigmoid(double z) {
    if (z >= 0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    double e = std::exp(z);
    return e / (1.0 + e);
}

struct SplitCandidate {
    int feature = -1;
    double threshold = 0.0;
    double gain = 0.0;
    size_t n_left = 0;
};

} // namespace

double RegressionTree::predict(const Row& x) const {
    int i = 0;
    while (nodes[i].left >= 0 || nodes[i].right >= 0) {
        const auto& nd = nodes[i];
        i = (x[nd.feature] <= nd.threshold) ? nd.left : nd.right;
    }
    return nodes[i].value;
}

GradientBoostingClassifier::GradientBoostingClassifier(const GradientBoostingParams& params)
    : params_(params) {
    if (params_.n_estimators < 1 || params_.max_depth < 1 || params_.learning_rate <= 0.0) {
        throw std::invalid_argument("Invalid gradient boosting parameters");
    }
}

int GradientBoostingClassifier::build_node(RegressionTree& tree, const Matrix& X,
                                           const std::vector<double>& residual,
                                           const std::vector<double>& hessian,
                                           std::vector<size_t>& idx, int depth,
                                           std::vector<double>& importance) const {
    double sum = 0.0, hess = 0.0;
    for (size_t i : idx) {
        sum += residual[i];
        hess += hessian[i];
    }
    
    int node_id = static_cast<int>(tree.nodes.size());
    // Newton step for log-loss
    double leaf_value = hess > 1e-12 ? sum / hess : 0.0;
    tree.nodes.push_back({-1, 0.0, -1, -1, leaf_value});
    
    size_t n = idx.size();
    if (depth >= params_.max_depth || n < static_cast<size_t>(params_.min_samples_split)) {
        return node_id;
    }
    
    const size_t min_leaf = static_cast<size_t>(std::max(1, params_.min_samples_leaf));
    double parent_score = sum * sum / static_cast<double>(n);
    SplitCandidate best;
    std::vector<size_t> order(idx);
    
    for (size_t f = 0; f < n_features_; ++f) {
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return X[a][f] < X[b][f];
        });
        
        double left_sum = 0.0;
        for (size_t k = 1; k < n; ++k) {
            left_sum += residual[order[k - 1]];
            double lo = X[order[k - 1]][f];
            double hi = X[order[k]][f];
            if (!(lo < hi)) continue;
            if (k < min_leaf || n - k < min_leaf) continue;
            
            double right_sum = sum - left_sum;
            // Weighted squared-error reduction
            double gain = left_sum * left_sum / static_cast<double>(k)
                        + right_sum * right_sum / static_cast<double>(n - k)
                        - parent_score;
            if (gain > best.gain + 1e-12) {
                best.feature = static_cast<int>(f);
                best.threshold = lo + (hi - lo) / 2.0;
                best.gain = gain;
                best.n_left = k;
            }
        }
    }
    
    if (best.feature < 0) {
        return node_id;
    }
    
    importance[static_cast<size_t>(best.feature)] += best.gain;
    
    std::vector<size_t> left_idx, right_idx;
    left_idx.reserve(best.n_left);
    right_idx.reserve(n - best.n_left);
    for (size_t i : idx) {
        if (X[i][static_cast<size_t>(best.feature)] <= best.threshold) {
            left_idx.push_back(i);
        } else {
            right_idx.push_back(i);
        }
    }
    
    int left = build_node(tree, X, residual, hessian, left_idx, depth + 1, importance);
    int right = build_node(tree, X, residual, hessian, right_idx, depth + 1, importance);
    
    auto& node = tree.nodes[static_cast<size_t>(node_id)];
    node.feature = best.feature;
    node.threshold = best.threshold;
    node.left = left;
    node.right = right;
    
    return node_id;
}

void GradientBoostingClassifier::fit(const Matrix& X, const std::vector<int>& y,
                                     const std::atomic<bool>* cancel) {
    if (X.empty() || X.size() != y.size()) {
        throw std::invalid_argument("X and y must be non-empty and the same length");
    }
    
    size_t n = X.size();
    size_t n_features = X.front().size();
    for (const auto& row : X) {
        if (row.size() != n_features) {
            throw std::invalid_argument("Ragged feature matrix");
        }
    }
    
    double positives = 0.0;
    for (int label : y) {
        if (label != 0 && label != 1) {
            throw std::invalid_argument("Labels must be 0 or 1");
        }
        positives += label;
    }
    if (positives == 0.0 || positives == static_cast<double>(n)) {
        throw InsufficientDataError("Training labels contain a single class");
    }
    
    n_features_ = n_features;
    double prior = positives / static_cast<double>(n);
    init_ = std::log(prior / (1.0 - prior));
    trees_.clear();
    trees_.reserve(static_cast<size_t>(params_.n_estimators));
    
    std::vector<double> raw(n, init_);
    std::vector<double> residual(n), hessian(n);
    std::vector<double> total_importance(n_features_, 0.0);
    std::vector<size_t> all(n);
    std::iota(all.begin(), all.end(), 0);
    
    for (int m = 0; m < params_.n_estimators; ++m) {
        if (cancel && cancel->load()) {
            throw TrainingCancelled();
        }
        
        for (size_t i = 0; i < n; ++i) {
            double p = sigmoid(raw[i]);
            residual[i] = static_cast<double>(y[i]) - p;
            hessian[i] = p * (1.0 - p);
        }
        
        RegressionTree tree;
        std::vector<double> importance(n_features_, 0.0);
        std::vector<size_t> idx(all);
        build_node(tree, X, residual, hessian, idx, 0, importance);
        
        for (size_t i = 0; i < n; ++i) {
            raw[i] += params_.learning_rate * tree.predict(X[i]);
        }
        
        double tree_total = std::accumulate(importance.begin(), importance.end(), 0.0);
        if (tree_total > 0.0) {
            for (size_t f = 0; f < n_features_; ++f) {
                total_importance[f] += importance[f] / tree_total;
            }
        }
        
        trees_.push_back(std::move(tree));
    }
    
    double total = std::accumulate(total_importance.begin(), total_importance.end(), 0.0);
    if (total > 0.0) {
        for (auto& v : total_importance) v /= total;
    }
    importances_ = std::move(total_importance);
}

double GradientBoostingClassifier::decision_function(const Row& x) const {
    if (x.size() != n_features_) {
        throw DataContractError("Expected " + std::to_string(n_features_) +
                                " features, got " + std::to_string(x.size()));
    }
    double raw = init_;
    for (const auto& tree : trees_) {
        raw += params_.learning_rate * tree.predict(x);
    }
    return raw;
}

std::array<double, 2> GradientBoostingClassifier::predict_proba(const Row& x) const {
    double p_home = sigmoid(decision_function(x));
    return {1.0 - p_home, p_home};
}

std::vector<double> GradientBoostingClassifier::feature_importances() const {
    return importances_;
}

nlohmann::json GradientBoostingClassifier::to_json() const {
    nlohmann::json trees = nlohmann::json::array();
    for (const auto& tree : trees_) {
        nlohmann::json feature = nlohmann::json::array();
        nlohmann::json threshold = nlohmann::json::array();
        nlohmann::json left = nlohmann::json::array();
        nlohmann::json right = nlohmann::json::array();
        nlohmann::json value = nlohmann::json::array();
        for (const auto& nd : tree.nodes) {
            feature.push_back(nd.feature);
            threshold.push_back(nd.threshold);
            left.push_back(nd.left);
            right.push_back(nd.right);
            value.push_back(nd.value);
        }
        trees.push_back({
            {"feature", feature},
            {"threshold", threshold},
            {"left", left},
            {"right", right},
            {"value", value}
        });
    }
    
    return {
        {"kind", kind()},
        {"n_estimators", params_.n_estimators},
        {"learning_rate", params_.learning_rate},
        {"max_depth", params_.max_depth},
        {"min_samples_split", params_.min_samples_split},
        {"min_samples_leaf", params_.min_samples_leaf},
        {"n_features", n_features_},
        {"init", init_},
        {"importances", importances_},
        {"trees", trees}
    };
}

std::unique_ptr<GradientBoostingClassifier> GradientBoostingClassifier::from_json(const nlohmann::json& j) {
    try {
        GradientBoostingParams params;
        params.n_estimators = j.at("n_estimators").get<int>();
        params.learning_rate = j.at("learning_rate").get<double>();
        params.max_depth = j.at("max_depth").get<int>();
        params.min_samples_split = j.value("min_samples_split", 2);
        params.min_samples_leaf = j.value("min_samples_leaf", 1);
        
        auto model = std::make_unique<GradientBoostingClassifier>(params);
        model->n_features_ = j.at("n_features").get<size_t>();
        model->init_ = j.at("init").get<double>();
        model->importances_ = j.at("importances").get<std::vector<double>>();
        if (model->importances_.size() != model->n_features_) {
            throw StoreError("Importance vector does not match feature count");
        }
        
        for (const auto& t : j.at("trees")) {
            auto feature = t.at("feature").get<std::vector<int>>();
            auto threshold = t.at("threshold").get<std::vector<double>>();
            auto left = t.at("left").get<std::vector<int>>();
            auto right = t.at("right").get<std::vector<int>>();
            auto value = t.at("value").get<std::vector<double>>();
            
            size_t count = feature.size();
            if (count == 0 || threshold.size() != count || left.size() != count ||
                right.size() != count || value.size() != count) {
                throw StoreError("Malformed tree in classifier state");
            }
            
            RegressionTree tree;
            tree.nodes.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                bool leaf = left[i] < 0 && right[i] < 0;
                // Children always come after their parent
                if (!leaf && (left[i] <= static_cast<int>(i) || right[i] <= static_cast<int>(i) ||
                              left[i] >= static_cast<int>(count) || right[i] >= static_cast<int>(count) ||
                              feature[i] < 0 || feature[i] >= static_cast<int>(model->n_features_))) {
                    throw StoreError("Malformed tree node in classifier state");
                }
                tree.nodes.push_back({feature[i], threshold[i], left[i], right[i], value[i]});
            }
            model->trees_.push_back(std::move(tree));
        }
        
        return model;
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(std::string("Invalid classifier state: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw StoreError(std::string("Invalid classifier parameters: ") + e.what());
    }
}

std::unique_ptr<Classifier> make_classifier(const nlohmann::json& state) {
    std::string kind = state.is_object() ? state.value("kind", "") : "";
    if (kind == "gradient_boosting") {
        return GradientBoostingClassifier::from_json(state);
    }
    throw StoreError("Unknown classifier kind: '" + kind + "'");
}
