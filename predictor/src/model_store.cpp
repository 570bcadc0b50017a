#include "model_store.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

FileModelStore::FileModelStore(const std::string& path) : path_(path) {
    spdlog::info("FileModelStore initialized: {}", path_);
}

void FileModelStore::save(const ModelArtifact& artifact) {
    std::string payload = artifact.to_json().dump();
    fs::path target(path_);
    fs::path tmp(path_ + ".tmp");
    
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw StoreError("Cannot create model directory: " + ec.message());
        }
    }
    
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StoreError("Cannot open " + tmp.string() + " for writing");
        }
        out << payload;
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw StoreError("Failed writing model artifact to " + tmp.string());
        }
    }
    
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StoreError("Failed to replace " + path_ + ": " + ec.message());
    }
    
    spdlog::info("Model v{} saved to {}", artifact.version, path_);
}

std::optional<ModelArtifact> FileModelStore::load() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            throw StoreError("Cannot stat " + path_ + ": " + ec.message());
        }
        return std::nullopt;
    }
    
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        throw StoreError("Cannot open " + path_ + " for reading");
    }
    
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& e) {
        throw StoreError("Corrupt model artifact at " + path_ + ": " + e.what());
    }
    
    ModelArtifact artifact = ModelArtifact::from_json(doc);
    spdlog::info("Model v{} loaded from {}", artifact.version, path_);
    return artifact;
}

bool FileModelStore::ping() {
    std::error_code ec;
    fs::path target(path_);
    fs::path dir = target.has_parent_path() ? target.parent_path() : fs::current_path(ec);
    if (ec) return false;
    return !fs::exists(dir, ec) || fs::is_directory(dir, ec);
}

std::string FileModelStore::describe() const {
    return "file:" + path_;
}
