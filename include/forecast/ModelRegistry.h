#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "forecast/TrainedModel.h"

namespace harvestcast {
namespace forecast {

// In-memory arena of trained models keyed by normalized SeriesKey string.
// Readers copy the shared_ptr under a shared lock, so a concurrent retrain
// swaps in a complete artifact without ever exposing a partial one.
class ModelRegistry {
public:
    TrainedModelPtr find(const std::string& key) const;

    // Replaces whatever is registered for key
    void publish(const std::string& key, TrainedModelPtr model);

    // Registers model unless key already has one; returns the registered model
    TrainedModelPtr publishIfAbsent(const std::string& key, TrainedModelPtr model);

    // Serializes training per key; distinct keys never contend
    std::unique_lock<std::mutex> lockForTraining(const std::string& key);

    std::size_t size() const;
    std::vector<std::string> keys() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TrainedModelPtr> models_;

    std::mutex train_locks_mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> train_locks_;
};

} // namespace forecast
} // namespace harvestcast
