#include "api.hpp"
#include "errors.hpp"
#include "game_record.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace {

ApiResponse error_response(int status, const std::string& kind, const std::string& detail) {
    return {status, {{"error", kind}, {"detail", detail}}};
}

} // namespace

PredictionApi::PredictionApi(PredictiveModel& model,
                             const FeatureVectorBuilder& builder,
                             TrainingWorker& worker,
                             const HealthCheck* health)
    : model_(model), builder_(builder), worker_(worker), health_(health) {}

nlohmann::json PredictionApi::parse_body(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        throw DataContractError("Request body is not valid JSON");
    }
    return parsed;
}

ApiResponse PredictionApi::guarded(const char* route, const std::function<ApiResponse()>& fn) {
    try {
        return fn();
    } catch (const DataContractError& e) {
        spdlog::debug("{}: invalid input: {}", route, e.what());
        return error_response(400, "data_contract", e.what());
    } catch (const NotReadyError& e) {
        spdlog::warn("{}: model not ready: {}", route, e.what());
        return error_response(503, "not_ready", e.what());
    } catch (const TrainingError& e) {
        spdlog::warn("{}: training rejected: {}", route, e.what());
        return error_response(422, "training", e.what());
    } catch (const StoreError& e) {
        spdlog::error("{}: store failure: {}", route, e.what());
        return error_response(500, "store", e.what());
    } catch (const std::exception& e) {
        spdlog::error("{}: {}", route, e.what());
        return error_response(500, "internal", e.what());
    }
}

ApiResponse PredictionApi::predict(const std::string& body) {
    return guarded("/predict", [&]() -> ApiResponse {
        auto req = parse_body(body);
        if (!req.is_object()) {
            throw DataContractError("Request must be a JSON object");
        }
        
        FeatureVector features;
        if (req.contains("features")) {
            features = FeatureVector::from_json(req["features"]);
        } else {
            if (!req.contains("game_data") || !req.contains("historical_games")) {
                throw DataContractError("game_data and historical_games are required");
            }
            GameRecord game = RecordParser::parse_game(req["game_data"]);
            std::vector<GameRecord> history = RecordParser::parse_games(req["historical_games"]);
            features = builder_.build(game, history);
        }
        
        Explanation explained = model_.explain(features);
        nlohmann::json out = explained.prediction.to_json();
        out["feature_importance"] = importances_to_json(explained.importances);
        return {200, out};
    });
}

ApiResponse PredictionApi::train(const std::string& body) {
    return guarded("/train", [&]() -> ApiResponse {
        auto games = RecordParser::parse_games(parse_body(body));
        if (games.empty()) {
            throw InsufficientDataError("Training requires at least one game");
        }
        try {
            int64_t job_id = worker_.submit(std::move(games));
            return {202, {{"message", "Training job queued"}, {"job_id", job_id}}};
        } catch (const JobConflictError& e) {
            return error_response(409, "busy", e.what());
        }
    });
}

ApiResponse PredictionApi::train_status() {
    return {200, worker_.status().to_json()};
}

ApiResponse PredictionApi::train_cancel() {
    bool cancelled = worker_.cancel();
    return {200, {{"cancelled", cancelled}}};
}

ApiResponse PredictionApi::model_info() {
    return guarded("/model/info", [&]() -> ApiResponse {
        auto artifact = model_.snapshot();
        nlohmann::json out = {
            {"features", canonical_schema()},
            {"model_type", model_.model_type()},
            {"state", model_state_string(model_.state())}
        };
        if (artifact) {
            out["importance"] = importances_to_json(model_.feature_importances());
            out["version"] = artifact->version;
            out["trained_at"] = artifact->trained_at;
        } else {
            out["importance"] = nullptr;
            out["version"] = nullptr;
        }
        return {200, out};
    });
}

ApiResponse PredictionApi::model_reload() {
    return guarded("/model/reload", [&]() -> ApiResponse {
        bool reloaded = model_.reload();
        auto artifact = model_.snapshot();
        nlohmann::json out = {{"reloaded", reloaded}};
        out["version"] = artifact ? nlohmann::json(artifact->version) : nlohmann::json(nullptr);
        return {reloaded ? 200 : 404, out};
    });
}

ApiResponse PredictionApi::health() {
    if (!health_) {
        return {200, {{"ok", true}}};
    }
    return {health_->is_healthy() ? 200 : 503, health_->get_status()};
}

void PredictionApi::register_routes(httplib::Server& server) {
    auto reply = [](httplib::Response& res, const ApiResponse& r) {
        res.status = r.status;
        res.set_content(r.body.dump(), "application/json");
    };
    
    server.Get("/health", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, health());
    });
    server.Post("/predict", [this, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, predict(req.body));
    });
    server.Post("/train", [this, reply](const httplib::Request& req, httplib::Response& res) {
        reply(res, train(req.body));
    });
    server.Get("/train/status", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, train_status());
    });
    server.Post("/train/cancel", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, train_cancel());
    });
    server.Get("/model/info", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, model_info());
    });
    server.Post("/model/reload", [this, reply](const httplib::Request&, httplib::Response& res) {
        reply(res, model_reload());
    });
}
