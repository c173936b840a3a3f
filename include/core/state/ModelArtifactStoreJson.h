#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/contracts/IModelArtifactStore.h"

namespace harvestcast {
namespace core {

// One pretty-printed JSON file per key under a directory.
// Writes go to "<file>.tmp" and are renamed over the target.
class ModelArtifactStoreJson : public IModelArtifactStore {
public:
    explicit ModelArtifactStoreJson(std::filesystem::path directory);

    std::optional<ModelArtifact> load(const std::string& key) override;
    bool save(const std::string& key, const ModelArtifact& artifact) override;

    std::filesystem::path pathFor(const std::string& key) const;

    static nlohmann::json toJson(const ModelArtifact& artifact);
    // Throws nlohmann::json::exception on malformed input
    static ModelArtifact fromJson(const nlohmann::json& raw);

private:
    std::filesystem::path directory_;
};

} // namespace core
} // namespace harvestcast
