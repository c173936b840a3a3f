#include "engine/AdvisoryService.h"

#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/SeriesKey.h"

namespace harvestcast {
namespace engine {

AdvisoryService::AdvisoryService(const data::TimeSeriesStore& store,
                                 const analytics::MarketAnalytics& analytics,
                                 forecast::EnsembleForecaster& forecaster,
                                 const forecast::ConfidenceEstimator& confidence,
                                 const RecommendationPolicy& policy,
                                 std::shared_ptr<core::ITrainingJournal> journal,
                                 analytics::AnalyticsConfig analytics_config)
    : store_(store)
    , analytics_(analytics)
    , forecaster_(forecaster)
    , confidence_(confidence)
    , policy_(policy)
    , journal_(std::move(journal))
    , analytics_config_(analytics_config) {}

std::vector<SeriesSample> AdvisoryService::trainingSeries(
    const std::string& commodity, const std::string& region,
    const std::optional<std::string>& market) const {
    return store_.aggregateForModeling(commodity, region, market,
                                       forecaster_.config().training_window_days);
}

void AdvisoryService::record(const std::string& key, core::TrainingOutcome outcome,
                             std::size_t data_points, const std::string& reason) {
    if (!journal_) {
        return;
    }
    core::TrainingEvent event;
    event.ts_ms = utils::DateUtils::nowMs();
    event.key = key;
    event.outcome = outcome;
    event.data_points = data_points;
    event.reason = reason;
    if (!journal_->append(event)) {
        LOG_WARN("Training journal append failed for {}", key);
    }
}

bool AdvisoryService::train(const std::string& commodity, const std::string& region,
                            const std::optional<std::string>& market) {
    return trainSeries(SeriesKey::make(commodity, region, market),
                       trainingSeries(commodity, region, market));
}

bool AdvisoryService::trainSeries(const SeriesKey& key, std::vector<SeriesSample> series) {
    const std::size_t points = series.size();

    try {
        const bool trained = forecaster_.train(std::move(series), key);
        record(key.str(), core::TrainingOutcome::TRAINED, points, "");
        return trained;
    } catch (const InsufficientDataError& e) {
        record(key.str(), core::TrainingOutcome::INSUFFICIENT_DATA, points, e.what());
        throw;
    }
}

PredictionResult AdvisoryService::predict(const std::string& commodity, const std::string& region,
                                          const std::optional<std::string>& market,
                                          int horizon_days) {
    PredictionResult result;
    const SeriesKey key = SeriesKey::make(commodity, region, market);
    result.key = key.str();
    result.forecast = forecaster_.predict(key, horizon_days);

    static const std::vector<SeriesSample> kNoHistory;
    const auto& history = result.forecast.model ? result.forecast.model->snapshot : kNoHistory;
    result.confidence = confidence_.score(history, result.forecast);

    if (!result.forecast.points.empty()) {
        Logger::getInstance().logForecast(result.key, horizon_days, result.confidence,
                                          forecast::toString(result.forecast.trend),
                                          result.forecast.points.front().point_estimate,
                                          result.forecast.points.back().point_estimate);
    }
    return result;
}

PredictionResult AdvisoryService::predictOrTrain(const std::string& commodity,
                                                 const std::string& region,
                                                 const std::optional<std::string>& market,
                                                 int horizon_days) {
    if (!forecaster_.hasModel(SeriesKey::make(commodity, region, market))) {
        LOG_INFO("No model for {}/{}; training on demand", commodity, region);
        train(commodity, region, market);
    }
    return predict(commodity, region, market, horizon_days);
}

Recommendation AdvisoryService::recommend(double current_price, const forecast::Forecast& forecast,
                                          analytics::VolatilityClass volatility,
                                          std::optional<double> reference_price) const {
    return policy_.recommend(current_price, forecast, volatility, reference_price);
}

Advice AdvisoryService::advise(const std::string& commodity, const std::string& region,
                               std::optional<double> current_price,
                               std::optional<double> reference_price,
                               const std::optional<std::string>& market) {
    Advice advice;
    advice.prediction = predictOrTrain(commodity, region, market,
                                       forecaster_.config().default_horizon_days);
    advice.key = advice.prediction.key;
    advice.volatility = analytics_.volatility(commodity, region,
                                              analytics_config_.volatility_window_days);
    advice.reference_price = reference_price;

    if (current_price) {
        advice.current_price = *current_price;
    } else if (advice.prediction.forecast.model &&
               !advice.prediction.forecast.model->snapshot.empty()) {
        advice.current_price = advice.prediction.forecast.model->snapshot.back().price;
    }

    advice.recommendation = policy_.recommend(advice.current_price, advice.prediction.forecast,
                                              advice.volatility.classification, reference_price);
    LOG_INFO("Advice for {}: {} (confidence {})", advice.key,
             toString(advice.recommendation.action), advice.recommendation.confidence);
    return advice;
}

std::vector<TrainOutcome> AdvisoryService::trainMany(const std::vector<TrainRequest>& requests) {
    std::vector<TrainOutcome> outcomes;
    outcomes.reserve(requests.size());
    std::size_t succeeded = 0;

    for (const auto& request : requests) {
        TrainOutcome outcome;
        const SeriesKey key = SeriesKey::make(request.commodity, request.region, request.market);
        outcome.key = key.str();

        try {
            // Counted and trained from the same aggregation
            auto series = trainingSeries(request.commodity, request.region, request.market);
            outcome.data_points = series.size();
            outcome.success = trainSeries(key, std::move(series));
        } catch (const InsufficientDataError& e) {
            outcome.reason = e.what();
        } catch (const std::exception& e) {
            outcome.reason = e.what();
            record(outcome.key, core::TrainingOutcome::FAILED, outcome.data_points, outcome.reason);
            LOG_ERROR("Training {} failed: {}", outcome.key, e.what());
        }

        if (outcome.success) {
            ++succeeded;
        }
        outcomes.push_back(std::move(outcome));
    }

    LOG_INFO("Batch training: {}/{} series trained", succeeded, requests.size());
    return outcomes;
}

} // namespace engine
} // namespace harvestcast
