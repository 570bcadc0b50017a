#pragma once
#include "model_store.hpp"
#include "predictive_model.hpp"
#include "redis_bus.hpp"
#include "training_worker.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

class HealthCheck {
public:
    // redis may be null when notifications are disabled
    HealthCheck(const std::string& service_name,
                std::shared_ptr<ModelStore> store,
                std::shared_ptr<RedisBus> redis,
                const PredictiveModel& model,
                const TrainingWorker& worker);
    
    nlohmann::json get_status() const;
    bool is_healthy() const;
    
private:
    std::string service_name_;
    std::shared_ptr<ModelStore> store_;
    std::shared_ptr<RedisBus> redis_;
    const PredictiveModel& model_;
    const TrainingWorker& worker_;
};
