#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;
    
    cfg.model_store = get_env("MODEL_STORE", "file");
    cfg.model_path = get_env("MODEL_PATH", "models/game_predictor.json");
    cfg.model_name = get_env("MODEL_NAME", "game_predictor");
    
    cfg.pg_dsn = get_env("PG_DSN");
    
    cfg.redis_url = get_env("REDIS_URL");
    cfg.stream_model_events = get_env("STREAM_MODEL_EVENTS", "gamepredict.model.events");
    
    cfg.stats_window = get_env_int("STATS_WINDOW", 5);
    
    cfg.test_fraction = get_env_double("TEST_FRACTION", 0.2);
    cfg.split_seed = get_env_int("SPLIT_SEED", 42);
    cfg.gb_n_estimators = get_env_int("GB_N_ESTIMATORS", 100);
    cfg.gb_learning_rate = get_env_double("GB_LEARNING_RATE", 0.1);
    cfg.gb_max_depth = get_env_int("GB_MAX_DEPTH", 5);
    
    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);
    
    cfg.service_name = get_env("SERVICE_NAME", "predictor");
    cfg.log_level = get_env("LOG_LEVEL", "info");
    
    return cfg;
}

void Config::validate() const {
    if (model_store != "file" && model_store != "postgres") {
        throw std::runtime_error("MODEL_STORE must be 'file' or 'postgres'");
    }
    if (model_store == "postgres" && pg_dsn.empty()) {
        throw std::runtime_error("PG_DSN is required when MODEL_STORE=postgres");
    }
    if (model_store == "file" && model_path.empty()) {
        throw std::runtime_error("MODEL_PATH is required when MODEL_STORE=file");
    }
    if (stats_window < 1) {
        throw std::runtime_error("STATS_WINDOW must be >= 1");
    }
    if (test_fraction <= 0.0 || test_fraction >= 1.0) {
        throw std::runtime_error("TEST_FRACTION must be in (0, 1)");
    }
    if (gb_n_estimators < 1 || gb_max_depth < 1 || gb_learning_rate <= 0.0) {
        throw std::runtime_error("Boosting parameters must be positive");
    }
    
    spdlog::info("Configuration validated successfully");
    if (model_store == "postgres") {
        spdlog::info("  Model store: postgres ({}, name={})", util::redact_dsn(pg_dsn), model_name);
    } else {
        spdlog::info("  Model store: file ({})", model_path);
    }
    spdlog::info("  Stats window: {} games", stats_window);
    spdlog::info("  Split: test_fraction={}, seed={}", test_fraction, split_seed);
    spdlog::info("  Boosting: estimators={}, learning_rate={}, max_depth={}",
                 gb_n_estimators, gb_learning_rate, gb_max_depth);
}
