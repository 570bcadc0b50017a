#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/scaler.hpp"
#include "../src/errors.hpp"
#include <cmath>

using Catch::Matchers::WithinAbs;

TEST_CASE("Scaling state", "[scaler]") {
    Matrix rows = {
        {1.0, 10.0, 5.0},
        {2.0, 20.0, 5.0},
        {3.0, 30.0, 5.0}
    };
    auto scaler = ScalingState::fit(rows);
    
    SECTION("Mean and population standard deviation") {
        REQUIRE(scaler.feature_count() == 3);
        REQUIRE_THAT(scaler.mean()[0], WithinAbs(2.0, 1e-12));
        REQUIRE_THAT(scaler.mean()[1], WithinAbs(20.0, 1e-12));
        REQUIRE_THAT(scaler.scale()[0], WithinAbs(std::sqrt(2.0 / 3.0), 1e-12));
        REQUIRE_THAT(scaler.scale()[1], WithinAbs(std::sqrt(200.0 / 3.0), 1e-12));
    }
    
    SECTION("Constant columns are centred, not divided by zero") {
        REQUIRE(scaler.scale()[2] == 1.0);
        auto out = scaler.transform(Row{7.0, 20.0, 5.0});
        REQUIRE(out[2] == 0.0);
    }
    
    SECTION("Transformed training columns have zero mean") {
        auto scaled = scaler.transform(rows);
        double sum = 0.0;
        for (const auto& r : scaled) sum += r[0];
        REQUIRE_THAT(sum, WithinAbs(0.0, 1e-12));
    }
    
    SECTION("Transform does not refit") {
        auto before = scaler.to_json();
        scaler.transform(Row{100.0, -5.0, 0.0});
        REQUIRE(scaler.to_json() == before);
    }
    
    SECTION("Wrong width is a contract error") {
        REQUIRE_THROWS_AS(scaler.transform(Row{1.0, 2.0}), DataContractError);
    }
    
    SECTION("Serialised state restores identically") {
        auto restored = ScalingState::from_json(scaler.to_json());
        REQUIRE(restored.mean() == scaler.mean());
        REQUIRE(restored.scale() == scaler.scale());
    }
}

TEST_CASE("Scaling state errors", "[scaler]") {
    SECTION("Empty matrix") {
        REQUIRE_THROWS_AS(ScalingState::fit(Matrix{}), std::invalid_argument);
    }
    
    SECTION("Corrupt persisted state") {
        nlohmann::json bad = {{"mean", {1.0, 2.0}}, {"scale", {1.0}}};
        REQUIRE_THROWS_AS(ScalingState::from_json(bad), StoreError);
        
        nlohmann::json zero = {{"mean", {1.0}}, {"scale", {0.0}}};
        REQUIRE_THROWS_AS(ScalingState::from_json(zero), StoreError);
        
        REQUIRE_THROWS_AS(ScalingState::from_json(nlohmann::json::object()), StoreError);
    }
}
