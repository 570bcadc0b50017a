#include "pg_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

PgModelStore::PgModelStore(const std::string& dsn, const std::string& model_name)
    : dsn_(dsn), model_name_(model_name) {
    spdlog::info("PgModelStore initialized: {} (model={})", util::redact_dsn(dsn), model_name_);
}

pqxx::connection PgModelStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PgModelStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS model_artifacts (
                id BIGSERIAL PRIMARY KEY,
                name TEXT NOT NULL,
                version INT NOT NULL,
                artifact JSONB NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS idx_model_artifacts_name_id
                ON model_artifacts (name, id DESC)
        )");
        txn.commit();
        
        spdlog::info("Model artifact schema ready");
    } catch (const std::exception& e) {
        spdlog::error("Failed to init model artifact schema: {}", e.what());
        throw StoreError(std::string("Schema init failed: ") + e.what());
    }
}

void PgModelStore::save(const ModelArtifact& artifact) {
    std::string payload = artifact.to_json().dump();
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec_params(
            "INSERT INTO model_artifacts (name, version, artifact) VALUES ($1, $2, $3::jsonb)",
            model_name_, artifact.version, payload);
        txn.commit();
        spdlog::info("Model v{} saved to postgres ({})", artifact.version, model_name_);
    } catch (const std::exception& e) {
        throw StoreError(std::string("Failed to save model artifact: ") + e.what());
    }
}

std::optional<ModelArtifact> PgModelStore::load() {
    std::string payload;
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        auto result = txn.exec_params(
            "SELECT artifact::text FROM model_artifacts WHERE name = $1 ORDER BY id DESC LIMIT 1",
            model_name_);
        txn.commit();
        
        if (result.empty()) {
            return std::nullopt;
        }
        payload = result[0][0].as<std::string>();
    } catch (const std::exception& e) {
        throw StoreError(std::string("Failed to load model artifact: ") + e.what());
    }
    
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(std::string("Corrupt model artifact row: ") + e.what());
    }
    
    ModelArtifact artifact = ModelArtifact::from_json(doc);
    spdlog::info("Model v{} loaded from postgres ({})", artifact.version, model_name_);
    return artifact;
}

bool PgModelStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Postgres ping failed: {}", e.what());
        return false;
    }
}

std::string PgModelStore::describe() const {
    return "postgres:" + model_name_;
}
