#pragma once

#include <optional>
#include <string>

#include "analytics/MarketAnalytics.h"
#include "common/Types.h"
#include "forecast/TrainedModel.h"

namespace harvestcast {
namespace engine {

enum class RecommendationAction {
    SELL_NOW,
    SELL_BEFORE,
    WAIT,
    HOLD_AND_MONITOR
};

struct Recommendation {
    RecommendationAction action = RecommendationAction::HOLD_AND_MONITOR;
    std::string reason;
    int confidence = 0;
    std::optional<DayNumber> best_date;
    std::optional<double> expected_price;
    bool volatility_warning = false;
    double potential_gain_percent = 0.0;
    int days_to_peak = 0;               // 1-based position of the peak in the horizon
};

// Sell-timing decision table over a forecast, the current price, market
// volatility and an optional reference (MSP) price.
class RecommendationPolicy {
public:
    Recommendation recommend(double current_price,
                             const forecast::Forecast& forecast,
                             analytics::VolatilityClass volatility,
                             std::optional<double> reference_price = std::nullopt) const;
};

std::string toString(RecommendationAction action);

} // namespace engine
} // namespace harvestcast
