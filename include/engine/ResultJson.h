#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "analytics/MarketAnalytics.h"
#include "common/Types.h"
#include "engine/AdvisoryService.h"
#include "engine/RecommendationPolicy.h"
#include "forecast/EnsembleForecaster.h"
#include "forecast/TrainedModel.h"

namespace harvestcast {
namespace engine {

// JSON views of service results for the CLI. Dates are ISO strings.
nlohmann::json toJson(const PricePoint& point);
nlohmann::json toJson(const std::vector<PricePoint>& points);
nlohmann::json toJson(const analytics::VolatilityProfile& profile);
nlohmann::json toJson(const analytics::TrendProfile& profile);
nlohmann::json toJson(const analytics::SeasonalProfile& profile);
nlohmann::json toJson(const analytics::AnomalyEvent& event);
nlohmann::json toJson(const std::vector<analytics::AnomalyEvent>& events);
nlohmann::json toJson(const analytics::MarketQuote& quote);
nlohmann::json toJson(const analytics::TopMovers& movers);
nlohmann::json toJson(const analytics::MarketReport& report);
nlohmann::json toJson(const forecast::Forecast& forecast);
nlohmann::json toJson(const forecast::ModelInfo& info);
nlohmann::json toJson(const PredictionResult& result);
nlohmann::json toJson(const Recommendation& recommendation);
nlohmann::json toJson(const Advice& advice);
nlohmann::json toJson(const TrainOutcome& outcome);

} // namespace engine
} // namespace harvestcast
