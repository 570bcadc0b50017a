#pragma once

#include "classifier.hpp"

struct GradientBoostingParams {
    int n_estimators = 100;
    double learning_rate = 0.1;
    int max_depth = 5;
    int min_samples_split = 2;
    int min_samples_leaf = 1;
};

// Leaf when left < 0 && right < 0
struct TreeNode {
    int feature;
    double threshold;
    int left;
    int right;
    double value;
};

struct RegressionTree {
    std::vector<TreeNode> nodes;
    
    double predict(const Row& x) const;
};

// Binary log-loss gradient boosting over depth-limited regression trees.
class GradientBoostingClassifier : public Classifier {
public:
    explicit GradientBoostingClassifier(const GradientBoostingParams& params = GradientBoostingParams());
    
    void fit(const Matrix& X, const std::vector<int>& y,
             const std::atomic<bool>* cancel) override;
    std::array<double, 2> predict_proba(const Row& x) const override;
    std::vector<double> feature_importances() const override;
    size_t feature_count() const override { return n_features_; }
    std::string kind() const override { return "gradient_boosting"; }
    nlohmann::json to_json() const override;
    
    static std::unique_ptr<GradientBoostingClassifier> from_json(const nlohmann::json& j);
    
    const GradientBoostingParams& params() const { return params_; }
    size_t tree_count() const { return trees_.size(); }
    
private:
    GradientBoostingParams params_;
    size_t n_features_ = 0;
    double init_ = 0.0;   // prior log-odds
    std::vector<RegressionTree> trees_;
    std::vector<double> importances_;
    
    double decision_function(const Row& x) const;
    
    int build_node(RegressionTree& tree, const Matrix& X,
                   const std::vector<double>& residual, const std::vector<double>& hessian,
                   std::vector<size_t>& idx, int depth,
                   std::vector<double>& importance) const;
};
