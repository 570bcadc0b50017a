#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/metrics.hpp"

using Catch::Matchers::WithinAbs;

TEST_CASE("Classification metrics", "[metrics]") {
    std::vector<int> y_true = {1, 1, 1, 0, 0};
    std::vector<int> y_pred = {1, 1, 0, 0, 1};
    
    SECTION("Accuracy") {
        REQUIRE_THAT(MetricsCalculator::accuracy(y_true, y_pred), WithinAbs(0.6, 1e-12));
        REQUIRE(MetricsCalculator::accuracy({}, {}) == 0.0);
    }
    
    SECTION("Per-class report") {
        auto report = MetricsCalculator::classification_report(y_true, y_pred);
        
        REQUIRE_THAT(report["1"].precision, WithinAbs(2.0 / 3.0, 1e-12));
        REQUIRE_THAT(report["1"].recall, WithinAbs(2.0 / 3.0, 1e-12));
        REQUIRE(report["1"].support == 3);
        REQUIRE_THAT(report["0"].precision, WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(report["0"].recall, WithinAbs(0.5, 1e-12));
        REQUIRE_THAT(report["0"].f1, WithinAbs(0.5, 1e-12));
        REQUIRE(report["0"].support == 2);
        
        REQUIRE_THAT(report["macro avg"].recall, WithinAbs((2.0 / 3.0 + 0.5) / 2.0, 1e-12));
        REQUIRE_THAT(report["weighted avg"].recall, WithinAbs(0.6, 1e-12));
        REQUIRE(report["weighted avg"].support == 5);
    }
    
    SECTION("Zero division scores zero") {
        auto report = MetricsCalculator::classification_report({0, 0}, {0, 0});
        REQUIRE(report["1"].precision == 0.0);
        REQUIRE(report["1"].recall == 0.0);
        REQUIRE(report["1"].f1 == 0.0);
        REQUIRE(report["0"].f1 == 1.0);
    }
    
    SECTION("JSON shape") {
        TrainingMetrics m;
        m.accuracy = 0.6;
        m.report = MetricsCalculator::classification_report(y_true, y_pred);
        m.persist_error = "disk full";
        
        auto j = m.to_json();
        REQUIRE(j["accuracy"] == 0.6);
        REQUIRE(j["classification_report"].contains("0"));
        REQUIRE(j["classification_report"]["1"].contains("f1-score"));
        REQUIRE(j["persisted"] == false);
        REQUIRE(j["persist_error"] == "disk full");
    }
}
