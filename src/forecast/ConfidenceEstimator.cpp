#include "forecast/ConfidenceEstimator.h"

#include <algorithm>

#include "analytics/Statistics.h"

namespace harvestcast {
namespace forecast {

int ConfidenceEstimator::score(const std::vector<SeriesSample>& history,
                               const Forecast& forecast) const {
    int confidence = 100;

    const std::size_t n = history.size();
    if (n < 30) {
        confidence -= 40;
    } else if (n < 60) {
        confidence -= 20;
    } else if (n < 90) {
        confidence -= 10;
    }

    std::vector<double> prices;
    prices.reserve(n);
    for (const auto& s : history) {
        prices.push_back(s.price);
    }
    const double mean = analytics::Statistics::mean(prices);
    const double cv = analytics::Statistics::coefficientOfVariation(
        analytics::Statistics::sampleStdDev(prices, mean), mean);

    if (cv > 15.0) {
        confidence -= 30;
    } else if (cv > 10.0) {
        confidence -= 20;
    } else if (cv > 5.0) {
        confidence -= 10;
    }

    if (forecast.seasonalParticipated()) {
        confidence += 10;
    }

    return std::clamp(confidence, 0, 100);
}

} // namespace forecast
} // namespace harvestcast
