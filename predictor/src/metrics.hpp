#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ClassReport {
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    int support = 0;
};

struct TrainingMetrics {
    double accuracy = 0.0;
    std::map<std::string, ClassReport> report;  // "0", "1", "macro avg", "weighted avg"
    size_t train_size = 0;
    size_t test_size = 0;
    int model_version = 0;
    std::string trained_at;
    
    bool persisted = false;
    std::string persist_error;
    
    nlohmann::json to_json() const;
};

class MetricsCalculator {
public:
    // Binary labels; zero denominators score 0
    static double accuracy(const std::vector<int>& y_true, const std::vector<int>& y_pred);
    static std::map<std::string, ClassReport> classification_report(
        const std::vector<int>& y_true, const std::vector<int>& y_pred);
};
