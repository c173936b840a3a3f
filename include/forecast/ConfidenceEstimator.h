#pragma once

#include <vector>

#include "common/Types.h"
#include "forecast/TrainedModel.h"

namespace harvestcast {
namespace forecast {

// Heuristic 0..100 score from history size, historical dispersion and
// whether the seasonal sub-model took part in the forecast.
class ConfidenceEstimator {
public:
    int score(const std::vector<SeriesSample>& history, const Forecast& forecast) const;
};

} // namespace forecast
} // namespace harvestcast
