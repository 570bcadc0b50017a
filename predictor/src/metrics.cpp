#include "metrics.hpp"
#include <stdexcept>

namespace {

double safe_div(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

nlohmann::json report_to_json(const ClassReport& r) {
    return {
        {"precision", r.precision},
        {"recall", r.recall},
        {"f1-score", r.f1},
        {"support", r.support}
    };
}

} // namespace

double MetricsCalculator::accuracy(const std::vector<int>& y_true, const std::vector<int>& y_pred) {
    if (y_true.size() != y_pred.size()) {
        throw std::invalid_argument("Label vectors differ in length");
    }
    if (y_true.empty()) return 0.0;
    
    size_t correct = 0;
    for (size_t i = 0; i < y_true.size(); ++i) {
        if (y_true[i] == y_pred[i]) correct++;
    }
    return static_cast<double>(correct) / static_cast<double>(y_true.size());
}

std::map<std::string, ClassReport> MetricsCalculator::classification_report(
    const std::vector<int>& y_true, const std::vector<int>& y_pred) {
    if (y_true.size() != y_pred.size()) {
        throw std::invalid_argument("Label vectors differ in length");
    }
    
    std::map<std::string, ClassReport> report;
    ClassReport macro, weighted;
    int total = static_cast<int>(y_true.size());
    
    for (int cls = 0; cls <= 1; ++cls) {
        double tp = 0, fp = 0, fn = 0;
        for (size_t i = 0; i < y_true.size(); ++i) {
            bool actual = y_true[i] == cls;
            bool predicted = y_pred[i] == cls;
            if (actual && predicted) tp++;
            else if (!actual && predicted) fp++;
            else if (actual && !predicted) fn++;
        }
        
        ClassReport r;
        r.precision = safe_div(tp, tp + fp);
        r.recall = safe_div(tp, tp + fn);
        r.f1 = safe_div(2.0 * r.precision * r.recall, r.precision + r.recall);
        r.support = static_cast<int>(tp + fn);
        report[std::to_string(cls)] = r;
        
        macro.precision += r.precision / 2.0;
        macro.recall += r.recall / 2.0;
        macro.f1 += r.f1 / 2.0;
        
        double w = safe_div(r.support, total);
        weighted.precision += r.precision * w;
        weighted.recall += r.recall * w;
        weighted.f1 += r.f1 * w;
    }
    
    macro.support = total;
    weighted.support = total;
    report["macro avg"] = macro;
    report["weighted avg"] = weighted;
    
    return report;
}

nlohmann::json TrainingMetrics::to_json() const {
    nlohmann::json classification = nlohmann::json::object();
    for (const auto& [name, r] : report) {
        classification[name] = report_to_json(r);
    }
    classification["accuracy"] = accuracy;
    
    nlohmann::json out = {
        {"accuracy", accuracy},
        {"classification_report", classification},
        {"train_size", train_size},
        {"test_size", test_size},
        {"model_version", model_version},
        {"trained_at", trained_at},
        {"persisted", persisted}
    };
    if (!persist_error.empty()) {
        out["persist_error"] = persist_error;
    }
    return out;
}
