#include "forecast/EnsembleForecaster.h"

#include <algorithm>
#include <cmath>

#include "analytics/Statistics.h"
#include "common/DateUtils.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "forecast/SeasonalTrendModel.h"

namespace harvestcast {
namespace forecast {

namespace {
constexpr double kTrendThresholdPercent = 1.0;

ContributingModels resolveWeights(bool seasonal_available, const EnsembleWeights& base) {
    ContributingModels models;
    models.seasonal_trend = seasonal_available && base.seasonal > 0.0;
    models.linear_trend = base.linear > 0.0;
    models.moving_average = base.moving_average > 0.0;

    // All base weights zeroed out: fall back to linear + moving average
    if (!models.seasonal_trend && !models.linear_trend && !models.moving_average) {
        models.linear_trend = true;
        models.moving_average = true;
        models.linear_weight = 0.5;
        models.moving_average_weight = 0.5;
        return models;
    }

    const double total = (models.seasonal_trend ? base.seasonal : 0.0) +
                         (models.linear_trend ? base.linear : 0.0) +
                         (models.moving_average ? base.moving_average : 0.0);
    models.seasonal_weight = models.seasonal_trend ? base.seasonal / total : 0.0;
    models.linear_weight = models.linear_trend ? base.linear / total : 0.0;
    models.moving_average_weight = models.moving_average ? base.moving_average / total : 0.0;
    return models;
}
}

EnsembleForecaster::EnsembleForecaster(std::shared_ptr<core::IModelArtifactStore> store,
                                       ForecastConfig config)
    : store_(std::move(store)), config_(std::move(config)) {}

bool EnsembleForecaster::train(std::vector<SeriesSample> series, const SeriesKey& key) {
    const std::string k = key.str();
    const std::size_t required = std::max<std::size_t>(1, config_.min_train_points);
    if (series.size() < required) {
        LOG_WARN("Training skipped for {}: {} points (need {})", k, series.size(), required);
        throw InsufficientDataError(k, series.size(), required);
    }

    std::stable_sort(series.begin(), series.end(),
                     [](const SeriesSample& a, const SeriesSample& b) { return a.date < b.date; });

    auto lock = registry_.lockForTraining(k);

    TrainedModelPtr model = buildModel(series, key);
    registry_.publish(k, model);

    if (store_) {
        core::ModelArtifact artifact;
        artifact.saved_at_ms = utils::DateUtils::nowMs();
        artifact.model = *model;
        if (!store_->save(k, artifact)) {
            LOG_ERROR("Model {} trained but could not be persisted; serving from memory", k);
        }
    }

    LOG_INFO("Trained {} on {} points ({} .. {}), seasonal={}",
             k, series.size(),
             utils::DateUtils::format(model->window_first),
             utils::DateUtils::format(model->window_last),
             model->seasonal.available ? "on" : "off");
    return true;
}

TrainedModelPtr EnsembleForecaster::buildModel(const std::vector<SeriesSample>& series,
                                               const SeriesKey& key) const {
    auto model = std::make_shared<TrainedModel>();
    model->key = key;
    model->snapshot = series;
    model->window_first = series.front().date;
    model->window_last = series.back().date;
    model->trained_at_ms = utils::DateUtils::nowMs();

    model->seasonal = SeasonalTrendModel::fit(series, config_.seasonal);

    std::vector<double> prices;
    prices.reserve(series.size());
    for (const auto& s : series) {
        prices.push_back(s.price);
    }

    const auto line = analytics::Statistics::fitLine(prices);
    model->linear.intercept = line.intercept;
    model->linear.slope = line.slope;

    const std::size_t window = std::max<std::size_t>(1, config_.ma_window);
    model->moving_average.window = std::min(window, prices.size());
    model->moving_average.value = analytics::Statistics::trailingMean(prices, window);

    return model;
}

Forecast EnsembleForecaster::predict(const SeriesKey& key, int horizon_days) {
    const std::string k = key.str();
    TrainedModelPtr model = resolve(k);
    if (!model) {
        throw ModelUnavailableError(k);
    }
    return forecastFrom(model, horizon_days, config_);
}

Forecast EnsembleForecaster::forecastFrom(const TrainedModelPtr& model, int horizon_days,
                                          const ForecastConfig& config) {
    Forecast forecast;
    forecast.model = model;
    if (!model || horizon_days < 1) {
        return forecast;
    }

    const double band = std::max(0.0, config.fallback_band_pct);
    const double n = static_cast<double>(model->snapshot.size());
    forecast.points.reserve(static_cast<std::size_t>(horizon_days));

    for (int i = 1; i <= horizon_days; ++i) {
        const DayNumber date = model->window_last + i;
        const auto seasonal = SeasonalTrendModel::predict(model->seasonal, date, i);

        ContributingModels weights = resolveWeights(seasonal.has_value(), config.weights);

        double blended = 0.0;
        if (weights.seasonal_trend) {
            blended += weights.seasonal_weight * seasonal->value;
        }
        if (weights.linear_trend) {
            const double x = n - 1.0 + static_cast<double>(i);
            blended += weights.linear_weight * (model->linear.intercept + model->linear.slope * x);
        }
        if (weights.moving_average) {
            blended += weights.moving_average_weight * model->moving_average.value;
        }

        const double band_abs = std::abs(blended) * band;
        double lower = blended - band_abs;
        double upper = blended + band_abs;
        if (weights.seasonal_trend) {
            lower = std::min(lower, seasonal->lower);
            upper = std::max(upper, seasonal->upper);
        }

        ForecastPoint point;
        point.date = date;
        point.point_estimate = blended;
        point.lower_bound = lower;
        point.upper_bound = upper;
        point.contributing_models = weights;
        forecast.points.push_back(point);
    }

    if (forecast.points.size() < 2) {
        forecast.trend = ForecastTrend::UNKNOWN;
        return forecast;
    }

    const double first = forecast.points.front().point_estimate;
    const double last = forecast.points.back().point_estimate;
    forecast.trend_percent = first > 0.0 ? (last / first - 1.0) * 100.0 : 0.0;
    if (forecast.trend_percent > kTrendThresholdPercent) {
        forecast.trend = ForecastTrend::RISING;
    } else if (forecast.trend_percent < -kTrendThresholdPercent) {
        forecast.trend = ForecastTrend::FALLING;
    } else {
        forecast.trend = ForecastTrend::STABLE;
    }
    return forecast;
}

TrainedModelPtr EnsembleForecaster::resolve(const std::string& key) {
    if (auto model = registry_.find(key)) {
        return model;
    }
    if (!store_) {
        return nullptr;
    }

    auto artifact = store_->load(key);
    if (!artifact) {
        return nullptr;
    }

    LOG_INFO("Loaded model {} from backing store", key);
    auto loaded = std::make_shared<const TrainedModel>(std::move(artifact->model));
    return registry_.publishIfAbsent(key, loaded);
}

bool EnsembleForecaster::hasModel(const SeriesKey& key) {
    return resolve(key.str()) != nullptr;
}

TrainedModelPtr EnsembleForecaster::model(const SeriesKey& key) {
    return resolve(key.str());
}

std::optional<ModelInfo> EnsembleForecaster::modelInfo(const SeriesKey& key) {
    TrainedModelPtr model = resolve(key.str());
    if (!model) {
        return std::nullopt;
    }

    ModelInfo info;
    info.key = key.str();
    info.trained_at_ms = model->trained_at_ms;
    info.window_first = model->window_first;
    info.window_last = model->window_last;
    info.sample_size = model->snapshot.size();
    info.seasonal_available = model->seasonal.available;
    return info;
}

} // namespace forecast
} // namespace harvestcast
