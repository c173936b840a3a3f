#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "common/SeriesKey.h"
#include "common/Types.h"

namespace harvestcast {
namespace forecast {

// Linear trend + yearly Fourier terms fitted on calendar time.
// Coefficients live in normalized units: t / t_scale and price / y_scale.
struct SeasonalTrendParams {
    bool available = false;
    DayNumber origin = 0;
    double t_scale = 1.0;
    double y_scale = 1.0;
    double period_days = 365.25;
    double intercept = 0.0;
    double slope = 0.0;
    std::vector<double> sin_coeffs;
    std::vector<double> cos_coeffs;
    double residual_std = 0.0;      // price units
    double interval_z = 1.6448536;
    std::size_t sample_size = 0;
};

// OLS over the observation index 0..n-1
struct LinearTrendParams {
    double intercept = 0.0;
    double slope = 0.0;
};

struct MovingAverageParams {
    std::size_t window = 0;
    double value = 0.0;
};

// Complete per-key artifact. Published as a whole and never mutated afterwards.
struct TrainedModel {
    SeriesKey key;
    SeasonalTrendParams seasonal;
    LinearTrendParams linear;
    MovingAverageParams moving_average;
    std::vector<SeriesSample> snapshot;     // training data, ascending by date
    DayNumber window_first = 0;
    DayNumber window_last = 0;
    long long trained_at_ms = 0;
};

using TrainedModelPtr = std::shared_ptr<const TrainedModel>;

// Which sub-models produced a forecast point, with their renormalized weights
struct ContributingModels {
    bool seasonal_trend = false;
    bool linear_trend = false;
    bool moving_average = false;
    double seasonal_weight = 0.0;
    double linear_weight = 0.0;
    double moving_average_weight = 0.0;

    double weightSum() const { return seasonal_weight + linear_weight + moving_average_weight; }
};

struct ForecastPoint {
    DayNumber date = 0;
    double point_estimate = 0.0;
    double lower_bound = 0.0;
    double upper_bound = 0.0;
    ContributingModels contributing_models;
};

enum class ForecastTrend { RISING, FALLING, STABLE, UNKNOWN };

struct Forecast {
    std::vector<ForecastPoint> points;
    ForecastTrend trend = ForecastTrend::UNKNOWN;
    double trend_percent = 0.0;
    TrainedModelPtr model;                  // artifact the points were computed from

    bool seasonalParticipated() const;
};

std::string toString(ForecastTrend value);

} // namespace forecast
} // namespace harvestcast
