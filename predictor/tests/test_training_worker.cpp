#include <catch2/catch_test_macros.hpp>
#include "../src/training_worker.hpp"
#include "../src/errors.hpp"
#include "test_helpers.hpp"
#include <thread>

using test_helpers::TempDir;
using test_helpers::make_game;

namespace {

TrainingOptions fast_options() {
    TrainingOptions opts;
    opts.boosting.n_estimators = 10;
    opts.boosting.max_depth = 2;
    return opts;
}

// Strong home team "s" plays weak "w" repeatedly, both home and away
std::vector<GameRecord> season(size_t n) {
    std::vector<GameRecord> games;
    for (size_t i = 0; i < n; ++i) {
        if (i % 2 == 0) {
            games.push_back(make_game("s", "w", 28, 10));
        } else {
            games.push_back(make_game("w", "s", 7, 31));
        }
        games.back().home_rest_days = static_cast<double>(i % 5 + 4);
    }
    return games;
}

} // namespace

TEST_CASE("Training worker", "[training_worker]") {
    TempDir dir;
    auto store = std::make_shared<FileModelStore>(dir.file("model.json"));
    PredictiveModel model(store, fast_options());
    FeatureVectorBuilder builder(5);
    TrainingWorker worker(model, builder);
    
    SECTION("Successful job trains the model off the caller thread") {
        int callbacks = 0;
        worker.on_success([&callbacks](const TrainingMetrics& m) {
            REQUIRE(m.model_version == 1);
            callbacks++;
        });
        worker.start();
        
        int64_t id = worker.submit(season(40));
        REQUIRE(id == 1);
        REQUIRE(worker.wait_idle(std::chrono::seconds(60)));
        
        auto status = worker.status();
        REQUIRE(status.state == JobState::Succeeded);
        REQUIRE(status.job_id == 1);
        REQUIRE(status.game_count == 40);
        REQUIRE(status.last_metrics.has_value());
        REQUIRE(status.last_error.empty());
        REQUIRE(callbacks == 1);
        REQUIRE(model.is_ready());
        
        auto j = status.to_json();
        REQUIRE(j["state"] == "succeeded");
        REQUIRE(j["metrics"]["model_version"] == 1);
    }
    
    SECTION("Degenerate job fails without a model") {
        worker.start();
        
        std::vector<GameRecord> all_away(10, make_game("a", "b", 3, 17));
        worker.submit(all_away);
        REQUIRE(worker.wait_idle(std::chrono::seconds(60)));
        
        auto status = worker.status();
        REQUIRE(status.state == JobState::Failed);
        REQUIRE_FALSE(status.last_error.empty());
        REQUIRE_FALSE(model.is_ready());
    }
    
    SECTION("Only one job at a time") {
        // Not started: the first job stays queued
        worker.submit(season(20));
        REQUIRE(worker.busy());
        REQUIRE(worker.status().state == JobState::Queued);
        REQUIRE_THROWS_AS(worker.submit(season(20)), TrainingError);
    }
    
    SECTION("Queued job can be cancelled") {
        worker.submit(season(20));
        REQUIRE(worker.cancel());
        REQUIRE_FALSE(worker.busy());
        REQUIRE(worker.status().state == JobState::Cancelled);
        REQUIRE_FALSE(worker.cancel());
        
        // A new job is accepted afterwards
        worker.start();
        worker.submit(season(30));
        REQUIRE(worker.wait_idle(std::chrono::seconds(60)));
        REQUIRE(worker.status().state == JobState::Succeeded);
        REQUIRE(worker.status().job_id == 2);
    }
    
    SECTION("Idle worker has nothing to cancel") {
        REQUIRE_FALSE(worker.cancel());
        REQUIRE(worker.status().state == JobState::Idle);
    }
}

TEST_CASE("Cancelling a running job keeps the previous model", "[training_worker]") {
    TempDir dir;
    auto store = std::make_shared<FileModelStore>(dir.file("model.json"));
    
    // Round count is read when each classifier is created
    auto rounds = std::make_shared<std::atomic<int>>(10);
    PredictiveModel model(store, fast_options(), [rounds] {
        GradientBoostingParams params;
        params.n_estimators = rounds->load();
        params.max_depth = 2;
        return std::make_unique<GradientBoostingClassifier>(params);
    });
    FeatureVectorBuilder builder(5);
    TrainingWorker worker(model, builder);
    
    model.train(builder.build_training_dataset(season(30)));
    REQUIRE(model.snapshot()->version == 1);
    
    rounds->store(200000);
    worker.start();
    worker.submit(season(30));
    
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (worker.status().state != JobState::Running &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(worker.status().state == JobState::Running);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    
    REQUIRE(worker.cancel());
    REQUIRE(worker.wait_idle(std::chrono::seconds(60)));
    
    auto status = worker.status();
    REQUIRE(status.state == JobState::Cancelled);
    REQUIRE(status.last_error == "Training cancelled");
    REQUIRE(model.snapshot()->version == 1);
    REQUIRE(model.state() == ModelState::Ready);
    REQUIRE(store->load()->version == 1);
}
