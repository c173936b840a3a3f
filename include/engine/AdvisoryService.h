#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analytics/AnalyticsConfig.h"
#include "analytics/MarketAnalytics.h"
#include "common/SeriesKey.h"
#include "core/contracts/ITrainingJournal.h"
#include "data/TimeSeriesStore.h"
#include "engine/RecommendationPolicy.h"
#include "forecast/ConfidenceEstimator.h"
#include "forecast/EnsembleForecaster.h"

namespace harvestcast {
namespace engine {

struct PredictionResult {
    std::string key;
    forecast::Forecast forecast;
    int confidence = 0;
};

struct TrainRequest {
    std::string commodity;
    std::string region;
    std::optional<std::string> market;
};

struct TrainOutcome {
    std::string key;
    bool success = false;
    std::size_t data_points = 0;
    std::string reason;
};

struct Advice {
    std::string key;
    double current_price = 0.0;
    std::optional<double> reference_price;
    analytics::VolatilityProfile volatility;
    PredictionResult prediction;
    Recommendation recommendation;
};

// Front door for callers: wires store, analytics, forecaster, confidence
// and policy together. Owns none of them.
class AdvisoryService {
public:
    AdvisoryService(const data::TimeSeriesStore& store,
                    const analytics::MarketAnalytics& analytics,
                    forecast::EnsembleForecaster& forecaster,
                    const forecast::ConfidenceEstimator& confidence,
                    const RecommendationPolicy& policy,
                    std::shared_ptr<core::ITrainingJournal> journal = nullptr,
                    analytics::AnalyticsConfig analytics_config = analytics::AnalyticsConfig());

    // Trains on the aggregated training window. Throws InsufficientDataError.
    bool train(const std::string& commodity, const std::string& region,
               const std::optional<std::string>& market = std::nullopt);

    // Throws ModelUnavailableError
    PredictionResult predict(const std::string& commodity, const std::string& region,
                             const std::optional<std::string>& market, int horizon_days);

    // Trains once from the store when no model exists yet
    PredictionResult predictOrTrain(const std::string& commodity, const std::string& region,
                                    const std::optional<std::string>& market, int horizon_days);

    Recommendation recommend(double current_price, const forecast::Forecast& forecast,
                             analytics::VolatilityClass volatility,
                             std::optional<double> reference_price = std::nullopt) const;

    // Forecast over the default horizon + recent volatility + policy.
    // Without current_price the latest training observation is used.
    Advice advise(const std::string& commodity, const std::string& region,
                  std::optional<double> current_price = std::nullopt,
                  std::optional<double> reference_price = std::nullopt,
                  const std::optional<std::string>& market = std::nullopt);

    // One outcome per request, in request order
    std::vector<TrainOutcome> trainMany(const std::vector<TrainRequest>& requests);

private:
    std::vector<SeriesSample> trainingSeries(const std::string& commodity,
                                             const std::string& region,
                                             const std::optional<std::string>& market) const;
    bool trainSeries(const SeriesKey& key, std::vector<SeriesSample> series);
    void record(const std::string& key, core::TrainingOutcome outcome,
                std::size_t data_points, const std::string& reason);

    const data::TimeSeriesStore& store_;
    const analytics::MarketAnalytics& analytics_;
    forecast::EnsembleForecaster& forecaster_;
    const forecast::ConfidenceEstimator& confidence_;
    const RecommendationPolicy& policy_;
    std::shared_ptr<core::ITrainingJournal> journal_;
    analytics::AnalyticsConfig analytics_config_;
};

} // namespace engine
} // namespace harvestcast
