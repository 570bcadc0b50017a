#pragma once

#include "model_artifact.hpp"
#include <optional>
#include <string>

class ModelStore {
public:
    virtual ~ModelStore() = default;
    
    // Throws StoreError on any write failure
    virtual void save(const ModelArtifact& artifact) = 0;
    
    // nullopt when nothing was ever saved; StoreError when present but unreadable
    virtual std::optional<ModelArtifact> load() = 0;
    
    virtual bool ping() = 0;
    virtual std::string describe() const = 0;
};

// JSON document on disk, replaced atomically through a temp file + rename
class FileModelStore : public ModelStore {
public:
    explicit FileModelStore(const std::string& path);
    
    void save(const ModelArtifact& artifact) override;
    std::optional<ModelArtifact> load() override;
    bool ping() override;
    std::string describe() const override;
    
private:
    std::string path_;
};
