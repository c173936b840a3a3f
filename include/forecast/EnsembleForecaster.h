#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/SeriesKey.h"
#include "common/Types.h"
#include "core/contracts/IModelArtifactStore.h"
#include "forecast/ForecastConfig.h"
#include "forecast/ModelRegistry.h"
#include "forecast/TrainedModel.h"

namespace harvestcast {
namespace forecast {

struct ModelInfo {
    std::string key;
    long long trained_at_ms = 0;
    DayNumber window_first = 0;
    DayNumber window_last = 0;
    std::size_t sample_size = 0;
    bool seasonal_available = false;
};

// Trains and serves the seasonal-trend / linear-trend / moving-average
// ensemble per SeriesKey. Trained models live in a ModelRegistry and are
// mirrored to an optional IModelArtifactStore.
class EnsembleForecaster {
public:
    EnsembleForecaster(std::shared_ptr<core::IModelArtifactStore> store,
                       ForecastConfig config = ForecastConfig());

    // Throws InsufficientDataError below min_train_points. Replaces any
    // prior model for the key; the prior one stays in place when this throws.
    bool train(std::vector<SeriesSample> series, const SeriesKey& key);

    // Throws ModelUnavailableError when the key was never trained.
    // horizon_days < 1 yields an empty forecast.
    Forecast predict(const SeriesKey& key, int horizon_days);

    bool hasModel(const SeriesKey& key);
    TrainedModelPtr model(const SeriesKey& key);
    std::optional<ModelInfo> modelInfo(const SeriesKey& key);

    const ForecastConfig& config() const { return config_; }
    const ModelRegistry& registry() const { return registry_; }

    // Pure forecast over an already trained model
    static Forecast forecastFrom(const TrainedModelPtr& model, int horizon_days,
                                 const ForecastConfig& config);

private:
    TrainedModelPtr resolve(const std::string& key);
    TrainedModelPtr buildModel(const std::vector<SeriesSample>& series,
                               const SeriesKey& key) const;

    std::shared_ptr<core::IModelArtifactStore> store_;
    ForecastConfig config_;
    ModelRegistry registry_;
};

} // namespace forecast
} // namespace harvestcast
