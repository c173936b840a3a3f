#pragma once

#include <optional>
#include <string>

#include "forecast/TrainedModel.h"

namespace harvestcast {
namespace core {

struct ModelArtifact {
    static constexpr int kSchemaVersion = 1;

    int schema_version = kSchemaVersion;
    long long saved_at_ms = 0;
    forecast::TrainedModel model;
};

// Durable backing store for trained models, one artifact per series key
class IModelArtifactStore {
public:
    virtual ~IModelArtifactStore() = default;

    virtual std::optional<ModelArtifact> load(const std::string& key) = 0;
    virtual bool save(const std::string& key, const ModelArtifact& artifact) = 0;
};

} // namespace core
} // namespace harvestcast
