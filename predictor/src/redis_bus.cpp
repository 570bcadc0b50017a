#include "redis_bus.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>
#include <iterator>
#include <utility>

namespace {
using Attrs = std::unordered_map<std::string, std::string>;
using Item = std::pair<std::string, Attrs>;
using ItemStream = std::vector<Item>;
}

RedisBus::RedisBus(const std::string& redis_url, const std::string& stream, const std::string& origin)
    : stream_(stream), origin_(origin) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {} (stream={})", redis_url, stream_);
    
    try {
        seed_cursor();
    } catch (const std::exception& e) {
        spdlog::warn("Model event cursor not seeded yet: {}", e.what());
    }
}

// Start after the newest entry so events appended between polls are still read
void RedisBus::seed_cursor() {
    ItemStream latest;
    redis_->xrevrange(stream_, "+", "-", 1, std::back_inserter(latest));
    last_id_ = latest.empty() ? "0-0" : latest.front().first;
    spdlog::debug("Model event cursor at {}", last_id_);
}

void RedisBus::publish_model_updated(int version) {
    nlohmann::json event = {
        {"event", "model_updated"},
        {"version", version},
        {"origin", origin_},
        {"ts", util::current_iso8601()}
    };
    
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = event.dump();
        redis_->xadd(stream_, "*", fields.begin(), fields.end());
        spdlog::info("Published model_updated v{} to {}", version, stream_);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish model event: {}", e.what());
    }
}

std::vector<nlohmann::json> RedisBus::poll_model_events(int count, int block_ms) {
    std::vector<nlohmann::json> results;
    
    try {
        if (last_id_.empty()) {
            seed_cursor();
        }
        
        std::unordered_map<std::string, ItemStream> items;
        redis_->xread(stream_, last_id_, std::chrono::milliseconds(block_ms), count,
                      std::inserter(items, items.end()));
        
        for (const auto& [_, item_stream] : items) {
            for (const auto& item : item_stream) {
                last_id_ = item.first;
                auto it = item.second.find("data");
                if (it == item.second.end()) continue;
                
                auto event = nlohmann::json::parse(it->second, nullptr, false);
                if (event.is_discarded()) {
                    spdlog::warn("Skipping malformed model event {}", item.first);
                    continue;
                }
                if (event.value("origin", "") == origin_) continue;
                results.push_back(std::move(event));
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to read model events: {}", e.what());
    }
    
    return results;
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
