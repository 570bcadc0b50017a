#pragma once

#include <string>
#include <cstdlib>

struct Config {
    // Model store
    std::string model_store;   // "file" or "postgres"
    std::string model_path;
    std::string model_name;
    
    // Postgres
    std::string pg_dsn;
    
    // Redis (optional, model update notifications)
    std::string redis_url;
    std::string stream_model_events;
    
    // Feature pipeline
    int stats_window;
    
    // Training
    double test_fraction;
    int split_seed;
    int gb_n_estimators;
    double gb_learning_rate;
    int gb_max_depth;
    
    // HTTP
    std::string listen_addr;
    int listen_port;
    
    // Service
    std::string service_name;
    std::string log_level;
    
    static Config from_env();
    void validate() const;
    
private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
};
