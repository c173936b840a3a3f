#pragma once

#include <optional>
#include <vector>

#include "common/Types.h"
#include "forecast/ForecastConfig.h"
#include "forecast/TrainedModel.h"

namespace harvestcast {
namespace forecast {

// Trend + yearly seasonality regression with a residual-based prediction
// interval. Solved as ridge-penalized least squares with Eigen.
class SeasonalTrendModel {
public:
    struct Estimate {
        double value;
        double lower;
        double upper;
    };

    // Returns params with available=false when disabled, when the window is
    // too short, or when the solve does not yield finite coefficients.
    static SeasonalTrendParams fit(const std::vector<SeriesSample>& series,
                                   const SeasonalConfig& config);

    // steps_ahead (>= 1) widens the interval with distance from the data
    static std::optional<Estimate> predict(const SeasonalTrendParams& params,
                                           DayNumber date, int steps_ahead);
};

} // namespace forecast
} // namespace harvestcast
