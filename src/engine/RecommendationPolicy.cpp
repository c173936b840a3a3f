#include "engine/RecommendationPolicy.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

#include "common/DateUtils.h"

namespace harvestcast {
namespace engine {

namespace {
std::string percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << "%";
    return oss.str();
}
}

Recommendation RecommendationPolicy::recommend(double current_price,
                                               const forecast::Forecast& forecast,
                                               analytics::VolatilityClass volatility,
                                               std::optional<double> reference_price) const {
    Recommendation rec;
    if (forecast.points.empty()) {
        rec.action = RecommendationAction::HOLD_AND_MONITOR;
        rec.reason = "insufficient data for a recommendation";
        rec.confidence = 0;
        return rec;
    }

    // Strictly greater keeps the earliest date on ties
    std::size_t peak_index = 0;
    for (std::size_t i = 1; i < forecast.points.size(); ++i) {
        if (forecast.points[i].point_estimate > forecast.points[peak_index].point_estimate) {
            peak_index = i;
        }
    }
    const auto& peak = forecast.points[peak_index];

    const double gain = current_price > 0.0
        ? (peak.point_estimate - current_price) / current_price * 100.0
        : 0.0;
    rec.potential_gain_percent = gain;
    rec.days_to_peak = static_cast<int>(peak_index) + 1;

    const bool high_volatility = volatility == analytics::VolatilityClass::HIGH ||
                                 volatility == analytics::VolatilityClass::VERY_HIGH;

    if (high_volatility && std::abs(gain) < 10.0) {
        rec.action = RecommendationAction::HOLD_AND_MONITOR;
        rec.reason = "high volatility (" + analytics::toString(volatility) +
                     "); wait for prices to stabilize";
        rec.confidence = 50;
        rec.volatility_warning = true;
        return rec;
    }

    if (gain > 7.0) {
        rec.action = RecommendationAction::WAIT;
        rec.reason = "price expected to rise " + percent(gain) + " by " +
                     utils::DateUtils::format(peak.date);
        rec.confidence = static_cast<int>(std::min<long>(90, 60 + std::lround(gain)));
        rec.best_date = peak.date;
        rec.expected_price = peak.point_estimate;
        return rec;
    }

    if (gain > 3.0) {
        rec.action = RecommendationAction::SELL_BEFORE;
        rec.reason = "moderate upside of " + percent(gain) + " expected";
        rec.confidence = 70;
        rec.best_date = peak.date;
        rec.expected_price = peak.point_estimate;
        return rec;
    }

    if (gain < -5.0) {
        rec.action = RecommendationAction::SELL_NOW;
        rec.reason = "price expected to drop " + percent(std::abs(gain)) +
                     "; current price is favorable";
        rec.confidence = static_cast<int>(std::min<long>(90, 60 + std::lround(std::abs(gain))));
        return rec;
    }

    if (reference_price && *reference_price > 0.0 && current_price >= *reference_price * 1.05) {
        rec.action = RecommendationAction::SELL_NOW;
        rec.reason = "price is " + percent((current_price / *reference_price - 1.0) * 100.0) +
                     " above the reference price";
        rec.confidence = 80;
        return rec;
    }

    rec.action = RecommendationAction::HOLD_AND_MONITOR;
    rec.reason = "price expected to remain stable; monitor for a better opportunity";
    rec.confidence = 65;
    return rec;
}

std::string toString(RecommendationAction action) {
    switch (action) {
        case RecommendationAction::SELL_NOW: return "SELL_NOW";
        case RecommendationAction::SELL_BEFORE: return "SELL_BEFORE";
        case RecommendationAction::WAIT: return "WAIT";
        case RecommendationAction::HOLD_AND_MONITOR: return "HOLD_AND_MONITOR";
    }
    return "HOLD_AND_MONITOR";
}

} // namespace engine
} // namespace harvestcast
