#include "forecast/ModelRegistry.h"

#include <algorithm>

namespace harvestcast {
namespace forecast {

TrainedModelPtr ModelRegistry::find(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = models_.find(key);
    if (it == models_.end()) {
        return nullptr;
    }
    return it->second;
}

void ModelRegistry::publish(const std::string& key, TrainedModelPtr model) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    models_[key] = std::move(model);
}

TrainedModelPtr ModelRegistry::publishIfAbsent(const std::string& key, TrainedModelPtr model) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto result = models_.emplace(key, std::move(model));
    return result.first->second;
}

std::unique_lock<std::mutex> ModelRegistry::lockForTraining(const std::string& key) {
    std::mutex* key_mutex = nullptr;
    {
        std::lock_guard<std::mutex> guard(train_locks_mutex_);
        auto& slot = train_locks_[key];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        key_mutex = slot.get();
    }
    return std::unique_lock<std::mutex>(*key_mutex);
}

std::size_t ModelRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return models_.size();
}

std::vector<std::string> ModelRegistry::keys() const {
    std::vector<std::string> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        out.reserve(models_.size());
        for (const auto& entry : models_) {
            out.push_back(entry.first);
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace forecast
} // namespace harvestcast
