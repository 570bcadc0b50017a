#pragma once
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

// Cross-process "model updated" notifications over a Redis stream
class RedisBus {
public:
    RedisBus(const std::string& redis_url, const std::string& stream, const std::string& origin);
    
    void publish_model_updated(int version);
    
    // Events appended since the last call, excluding ones this process published
    std::vector<nlohmann::json> poll_model_events(int count, int block_ms);
    
    bool ping();
    
private:
    std::shared_ptr<sw::redis::Redis> redis_;
    std::string stream_;
    std::string origin_;
    std::string last_id_;   // empty until seeded from the stream tail
    
    void seed_cursor();
};
