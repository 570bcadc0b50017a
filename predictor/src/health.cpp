#include "health.hpp"
#include "util.hpp"

HealthCheck::HealthCheck(const std::string& service_name,
                         std::shared_ptr<ModelStore> store,
                         std::shared_ptr<RedisBus> redis,
                         const PredictiveModel& model,
                         const TrainingWorker& worker)
    : service_name_(service_name), store_(store), redis_(redis),
      model_(model), worker_(worker) {}

nlohmann::json HealthCheck::get_status() const {
    bool store_ok = store_->ping();
    auto artifact = model_.snapshot();
    
    nlohmann::json status = {
        {"ok", store_ok},
        {"service", service_name_},
        {"model_ready", artifact != nullptr},
        {"model_state", model_state_string(model_.state())},
        {"training", job_state_string(worker_.status().state)},
        {"store", store_->describe()},
        {"store_ok", store_ok},
        {"ts", util::current_iso8601()}
    };
    status["model_version"] = artifact ? nlohmann::json(artifact->version) : nlohmann::json(nullptr);
    
    if (redis_) {
        status["redis"] = redis_->ping();
    } else {
        status["redis"] = "disabled";
    }
    
    return status;
}

bool HealthCheck::is_healthy() const {
    return store_->ping();
}
