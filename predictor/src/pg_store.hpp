#pragma once
#include "model_store.hpp"
#include <string>
#include <pqxx/pqxx>

// Versioned artifacts in Postgres; load() returns the newest row for the model name
class PgModelStore : public ModelStore {
public:
    PgModelStore(const std::string& dsn, const std::string& model_name);
    
    void init_schema();
    
    void save(const ModelArtifact& artifact) override;
    std::optional<ModelArtifact> load() override;
    bool ping() override;
    std::string describe() const override;
    
private:
    std::string dsn_;
    std::string model_name_;
    pqxx::connection make_connection();
};
