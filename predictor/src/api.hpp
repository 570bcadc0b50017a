#pragma once

#include "feature_vector.hpp"
#include "health.hpp"
#include "predictive_model.hpp"
#include "training_worker.hpp"
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace httplib { class Server; }

struct ApiResponse {
    int status;
    nlohmann::json body;
};

// Thin JSON adapter over the prediction core
class PredictionApi {
public:
    PredictionApi(PredictiveModel& model,
                  const FeatureVectorBuilder& builder,
                  TrainingWorker& worker,
                  const HealthCheck* health);
    
    // POST /predict {"game_data": {...}, "historical_games": [...]} or {"features": {...}}
    ApiResponse predict(const std::string& body);
    // POST /train [game, ...]
    ApiResponse train(const std::string& body);
    ApiResponse train_status();
    ApiResponse train_cancel();
    ApiResponse model_info();
    ApiResponse model_reload();
    ApiResponse health();
    
    void register_routes(httplib::Server& server);
    
private:
    PredictiveModel& model_;
    FeatureVectorBuilder builder_;
    TrainingWorker& worker_;
    const HealthCheck* health_;
    
    static ApiResponse guarded(const char* route, const std::function<ApiResponse()>& fn);
    static nlohmann::json parse_body(const std::string& body);
};
