#include "config.hpp"
#include "api.hpp"
#include "feature_vector.hpp"
#include "health.hpp"
#include "model_store.hpp"
#include "pg_store.hpp"
#include "predictive_model.hpp"
#include "redis_bus.hpp"
#include "training_worker.hpp"
#include "errors.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <unistd.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("gamepredict", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("Logging initialized at level: {}", log_level);
}

std::shared_ptr<ModelStore> make_store(const Config& config) {
    if (config.model_store == "postgres") {
        auto pg = std::make_shared<PgModelStore>(config.pg_dsn, config.model_name);
        pg->init_schema();
        return pg;
    }
    return std::make_shared<FileModelStore>(config.model_path);
}

int main() {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();
        
        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);
        
        auto store = make_store(config);
        
        TrainingOptions options;
        options.test_fraction = config.test_fraction;
        options.split_seed = static_cast<uint32_t>(config.split_seed);
        options.boosting.n_estimators = config.gb_n_estimators;
        options.boosting.learning_rate = config.gb_learning_rate;
        options.boosting.max_depth = config.gb_max_depth;
        
        PredictiveModel model(store, options);
        FeatureVectorBuilder builder(config.stats_window);
        TrainingWorker worker(model, builder);
        
        // Serve immediately; a missing model only fails /predict until one is trained
        try {
            if (!model.reload()) {
                spdlog::warn("No stored model yet, waiting for /train");
            }
        } catch (const StoreError& e) {
            spdlog::error("Stored model unusable: {}", e.what());
        }
        
        std::shared_ptr<RedisBus> redis;
        if (!config.redis_url.empty()) {
            std::string origin = config.service_name + ":" + std::to_string(getpid());
            redis = std::make_shared<RedisBus>(config.redis_url, config.stream_model_events, origin);
            if (!redis->ping()) {
                spdlog::error("Failed to connect to Redis");
                return 1;
            }
            worker.on_success([redis](const TrainingMetrics& metrics) {
                if (metrics.persisted) {
                    redis->publish_model_updated(metrics.model_version);
                }
            });
        }
        
        HealthCheck health(config.service_name, store, redis, model, worker);
        PredictionApi api(model, builder, worker, &health);
        
        httplib::Server http_server;
        api.register_routes(http_server);
        
        worker.start();
        
        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            if (!http_server.listen(config.listen_addr.c_str(), config.listen_port)) {
                spdlog::error("HTTP server failed to bind {}:{}",
                              config.listen_addr, config.listen_port);
                shutdown_requested = true;
            }
        });
        
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);
        
        spdlog::info("Entering main loop");
        
        while (!shutdown_requested) {
            try {
                if (redis) {
                    // Another process trained and saved; converge on the stored artifact
                    auto events = redis->poll_model_events(10, 500);
                    for (const auto& event : events) {
                        if (event.value("event", "") != "model_updated") continue;
                        spdlog::info("Model v{} published by {}, reloading",
                                     event.value("version", 0), event.value("origin", ""));
                        model.reload();
                    }
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                }
            } catch (const std::exception& e) {
                spdlog::error("Error in main loop: {}", e.what());
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }
        
        spdlog::info("Shutting down gracefully");
        worker.cancel();
        worker.stop();
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }
        
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
