#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/model_store.hpp"
#include "../src/predictive_model.hpp"
#include "../src/errors.hpp"
#include "test_helpers.hpp"
#include <fstream>

using Catch::Matchers::WithinAbs;
using test_helpers::TempDir;

namespace {

TrainingOptions fast_options() {
    TrainingOptions opts;
    opts.boosting.n_estimators = 15;
    opts.boosting.max_depth = 3;
    return opts;
}

} // namespace

TEST_CASE("File model store", "[model_store]") {
    TempDir dir;
    auto path = dir.file("models/game_predictor.json");
    auto store = std::make_shared<FileModelStore>(path);
    
    SECTION("Nothing saved yet is not-found, not an error") {
        REQUIRE_FALSE(store->load().has_value());
        REQUIRE(store->ping());
    }
    
    SECTION("Round trip keeps predictions identical") {
        PredictiveModel model(store, fast_options());
        auto dataset = test_helpers::threshold_dataset(60);
        model.train(dataset);
        
        auto loaded = store->load();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->version == 1);
        REQUIRE(loaded->schema == canonical_schema());
        
        auto original = model.snapshot();
        for (const auto& fv : dataset.features) {
            auto a = original->classifier->predict_proba(original->scaler.transform(fv));
            auto b = loaded->classifier->predict_proba(loaded->scaler.transform(fv));
            REQUIRE_THAT(a[1], WithinAbs(b[1], 1e-9));
        }
        REQUIRE(loaded->scaler.mean() == original->scaler.mean());
    }
    
    SECTION("Save replaces the previous artifact") {
        PredictiveModel model(store, fast_options());
        model.train(test_helpers::threshold_dataset(40));
        model.train(test_helpers::threshold_dataset(50));
        
        REQUIRE(store->load()->version == 2);
        REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));
    }
    
    SECTION("Corrupt file is a store error") {
        std::filesystem::create_directories(dir.path() / "models");
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        REQUIRE_THROWS_AS(store->load(), StoreError);
    }
    
    SECTION("Foreign document is a store error") {
        std::filesystem::create_directories(dir.path() / "models");
        {
            std::ofstream out(path);
            out << R"({"format": "something.else"})";
        }
        REQUIRE_THROWS_AS(store->load(), StoreError);
    }
    
    SECTION("Schema mismatch is rejected on load") {
        PredictiveModel model(store, fast_options());
        model.train(test_helpers::threshold_dataset(40));
        
        nlohmann::json doc;
        {
            std::ifstream in(path);
            in >> doc;
        }
        std::swap(doc["schema"][0], doc["schema"][1]);
        {
            std::ofstream out(path);
            out << doc.dump();
        }
        
        REQUIRE_THROWS_AS(store->load(), StoreError);
    }
    
    SECTION("Unwritable location reports a store error") {
        // Parent "directory" is a regular file
        auto blocker = dir.file("blocker");
        {
            std::ofstream out(blocker);
            out << "x";
        }
        auto bad_store = std::make_shared<FileModelStore>(blocker + "/model.json");
        
        PredictiveModel model(store, fast_options());
        model.train(test_helpers::threshold_dataset(40));
        
        REQUIRE_THROWS_AS(bad_store->save(*model.snapshot()), StoreError);
    }
}
