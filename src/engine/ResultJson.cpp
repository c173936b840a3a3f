#include "engine/ResultJson.h"

#include "common/DateUtils.h"

namespace harvestcast {
namespace engine {

using utils::DateUtils;

nlohmann::json toJson(const PricePoint& point) {
    return {
        {"commodity", point.commodity},
        {"state", point.region},
        {"market", point.market},
        {"district", point.district},
        {"date", DateUtils::format(point.date)},
        {"min_price", point.min_price},
        {"max_price", point.max_price},
        {"modal_price", point.modal_price}
    };
}

nlohmann::json toJson(const std::vector<PricePoint>& points) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : points) {
        out.push_back(toJson(p));
    }
    return out;
}

nlohmann::json toJson(const analytics::VolatilityProfile& profile) {
    return {
        {"std_dev", profile.std_dev},
        {"mean", profile.mean},
        {"coefficient_of_variation", profile.coefficient_of_variation},
        {"classification", analytics::toString(profile.classification)},
        {"sample_size", profile.sample_size}
    };
}

nlohmann::json toJson(const analytics::TrendProfile& profile) {
    return {
        {"direction", analytics::toString(profile.direction)},
        {"strength", profile.strength},
        {"strength_label", profile.strength_label},
        {"change_percent", profile.change_percent},
        {"slope", profile.slope},
        {"first_price", profile.first_price},
        {"last_price", profile.last_price},
        {"sample_size", profile.sample_size}
    };
}

nlohmann::json toJson(const analytics::SeasonalProfile& profile) {
    nlohmann::json j;
    j["has_pattern"] = profile.has_pattern;
    if (!profile.has_pattern) {
        return j;
    }
    j["peak_month"] = DateUtils::monthName(profile.peak_month);
    j["peak_price"] = profile.peak_price;
    j["trough_month"] = DateUtils::monthName(profile.trough_month);
    j["trough_price"] = profile.trough_price;
    j["seasonal_strength"] = profile.seasonal_strength;
    j["strength_label"] = profile.strength_label;

    nlohmann::json monthly = nlohmann::json::object();
    for (const auto& entry : profile.monthly_averages) {
        monthly[DateUtils::monthName(entry.first)] = entry.second;
    }
    j["monthly_averages"] = std::move(monthly);
    return j;
}

nlohmann::json toJson(const analytics::AnomalyEvent& event) {
    return {
        {"date", DateUtils::format(event.date)},
        {"market", event.market},
        {"price", event.price},
        {"mean", event.mean},
        {"deviation_percent", event.deviation_percent},
        {"z_score", event.z_score},
        {"type", analytics::toString(event.type)},
        {"severity", analytics::toString(event.severity)}
    };
}

nlohmann::json toJson(const std::vector<analytics::AnomalyEvent>& events) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& e : events) {
        out.push_back(toJson(e));
    }
    return out;
}

nlohmann::json toJson(const analytics::MarketQuote& quote) {
    return {
        {"market", quote.market},
        {"district", quote.district},
        {"date", DateUtils::format(quote.date)},
        {"modal_price", quote.modal_price},
        {"min_price", quote.min_price},
        {"max_price", quote.max_price},
        {"diff_from_avg_percent", quote.diff_from_avg_percent},
        {"price_status", quote.price_status}
    };
}

nlohmann::json toJson(const analytics::TopMovers& movers) {
    auto list = [](const std::vector<analytics::CommodityMove>& moves) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& m : moves) {
            out.push_back({
                {"commodity", m.commodity},
                {"first_price", m.first_price},
                {"last_price", m.last_price},
                {"change_percent", m.change_percent},
                {"change_amount", m.change_amount}
            });
        }
        return out;
    };
    return {{"gainers", list(movers.gainers)}, {"losers", list(movers.losers)}};
}

nlohmann::json toJson(const analytics::MarketReport& report) {
    nlohmann::json quotes = nlohmann::json::array();
    for (const auto& q : report.top_markets) {
        quotes.push_back(toJson(q));
    }
    return {
        {"commodity", report.commodity},
        {"state", report.region},
        {"window_days", report.window_days},
        {"health_score", report.health.score},
        {"health_status", report.health.status},
        {"volatility", toJson(report.volatility)},
        {"trend", toJson(report.trend)},
        {"seasonality", toJson(report.seasonal)},
        {"anomalies", toJson(report.anomalies)},
        {"top_markets", std::move(quotes)},
        {"generated_at_ms", report.generated_at_ms}
    };
}

nlohmann::json toJson(const forecast::Forecast& forecast) {
    nlohmann::json points = nlohmann::json::array();
    for (const auto& p : forecast.points) {
        const auto& m = p.contributing_models;
        nlohmann::json models = nlohmann::json::object();
        if (m.seasonal_trend) {
            models["seasonal_trend"] = m.seasonal_weight;
        }
        if (m.linear_trend) {
            models["linear_trend"] = m.linear_weight;
        }
        if (m.moving_average) {
            models["moving_average"] = m.moving_average_weight;
        }
        points.push_back({
            {"date", DateUtils::format(p.date)},
            {"point_estimate", p.point_estimate},
            {"lower_bound", p.lower_bound},
            {"upper_bound", p.upper_bound},
            {"contributing_models", std::move(models)}
        });
    }
    return {
        {"points", std::move(points)},
        {"trend", forecast::toString(forecast.trend)},
        {"trend_percent", forecast.trend_percent}
    };
}

nlohmann::json toJson(const forecast::ModelInfo& info) {
    return {
        {"key", info.key},
        {"trained_at_ms", info.trained_at_ms},
        {"window_first", DateUtils::format(info.window_first)},
        {"window_last", DateUtils::format(info.window_last)},
        {"sample_size", info.sample_size},
        {"seasonal_available", info.seasonal_available}
    };
}

nlohmann::json toJson(const PredictionResult& result) {
    nlohmann::json j = toJson(result.forecast);
    j["key"] = result.key;
    j["confidence"] = result.confidence;
    return j;
}

nlohmann::json toJson(const Recommendation& recommendation) {
    nlohmann::json j;
    j["action"] = toString(recommendation.action);
    j["reason"] = recommendation.reason;
    j["confidence"] = recommendation.confidence;
    j["potential_gain_percent"] = recommendation.potential_gain_percent;
    j["volatility_warning"] = recommendation.volatility_warning;
    if (recommendation.best_date) {
        j["best_date"] = DateUtils::format(*recommendation.best_date);
    }
    if (recommendation.expected_price) {
        j["expected_price"] = *recommendation.expected_price;
    }
    return j;
}

nlohmann::json toJson(const Advice& advice) {
    nlohmann::json j;
    j["key"] = advice.key;
    j["current_price"] = advice.current_price;
    if (advice.reference_price) {
        j["reference_price"] = *advice.reference_price;
    }
    j["volatility"] = toJson(advice.volatility);
    j["forecast"] = toJson(advice.prediction);
    j["recommendation"] = toJson(advice.recommendation);
    return j;
}

nlohmann::json toJson(const TrainOutcome& outcome) {
    return {
        {"key", outcome.key},
        {"success", outcome.success},
        {"data_points", outcome.data_points},
        {"reason", outcome.reason}
    };
}

} // namespace engine
} // namespace harvestcast
