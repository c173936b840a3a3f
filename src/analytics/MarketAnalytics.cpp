#include "analytics/MarketAnalytics.h"
#include "analytics/Statistics.h"
#include "common/DateUtils.h"
#include "common/Logger.h"
#include "common/SeriesKey.h"
#include <algorithm>
#include <cmath>
#include <map>

namespace harvestcast {
namespace analytics {

namespace {
void sortByDate(std::vector<PricePoint>& series) {
    std::stable_sort(series.begin(), series.end(), [](const PricePoint& a, const PricePoint& b) {
        return a.date < b.date;
    });
}

std::vector<double> modalPrices(const std::vector<PricePoint>& series) {
    std::vector<double> prices;
    prices.reserve(series.size());
    for (const auto& p : series) {
        prices.push_back(p.modal_price);
    }
    return prices;
}

double percentChange(double from, double to) {
    return (from > 0.0) ? (to - from) / from * 100.0 : 0.0;
}
}

MarketAnalytics::MarketAnalytics(const data::TimeSeriesStore& store)
    : store_(store) {}

// ===== Classification =====

VolatilityClass MarketAnalytics::classifyVolatility(double cv) {
    if (cv < 5.0) return VolatilityClass::LOW;
    if (cv < 10.0) return VolatilityClass::MODERATE;
    if (cv < 15.0) return VolatilityClass::HIGH;
    return VolatilityClass::VERY_HIGH;
}

TrendDirection MarketAnalytics::classifyTrend(double change_percent) {
    if (std::abs(change_percent) < 2.0) return TrendDirection::STABLE;
    return change_percent > 0.0 ? TrendDirection::UPWARD : TrendDirection::DOWNWARD;
}

std::string MarketAnalytics::trendStrengthLabel(double strength) {
    if (strength < 3.0) return "weak";
    if (strength < 7.0) return "moderate";
    if (strength < 15.0) return "strong";
    return "very strong";
}

std::string MarketAnalytics::seasonalStrengthLabel(double seasonal_strength) {
    if (seasonal_strength < 5.0) return "weak";
    if (seasonal_strength < 10.0) return "moderate";
    return "strong";
}

// ===== Series computations =====

VolatilityProfile MarketAnalytics::computeVolatility(std::vector<PricePoint> series) {
    VolatilityProfile profile;
    profile.sample_size = series.size();
    if (series.size() < kMinVolatilityPoints) {
        return profile;
    }

    sortByDate(series);
    const auto prices = modalPrices(series);
    profile.mean = Statistics::mean(prices);
    profile.std_dev = Statistics::sampleStdDev(prices, profile.mean);
    profile.coefficient_of_variation = Statistics::coefficientOfVariation(profile.std_dev, profile.mean);
    profile.classification = classifyVolatility(profile.coefficient_of_variation);
    return profile;
}

TrendProfile MarketAnalytics::computeTrend(std::vector<PricePoint> series) {
    TrendProfile profile;
    profile.sample_size = series.size();
    if (series.size() < kMinTrendPoints) {
        return profile;
    }

    sortByDate(series);
    const auto prices = modalPrices(series);
    const auto fit = Statistics::fitLine(prices);

    profile.slope = fit.slope;
    profile.first_price = prices.front();
    profile.last_price = prices.back();
    profile.change_percent = percentChange(profile.first_price, profile.last_price);
    profile.direction = classifyTrend(profile.change_percent);
    profile.strength = std::abs(profile.change_percent);
    profile.strength_label = trendStrengthLabel(profile.strength);
    return profile;
}

SeasonalProfile MarketAnalytics::computeSeasonality(const std::vector<PricePoint>& series) {
    SeasonalProfile profile;
    if (series.empty()) {
        return profile;
    }

    std::map<int, std::pair<double, int>> by_month;
    for (const auto& p : series) {
        auto& acc = by_month[utils::DateUtils::month(p.date)];
        acc.first += p.modal_price;
        acc.second += 1;
    }

    std::vector<double> averages;
    for (const auto& entry : by_month) {
        const double avg = entry.second.first / entry.second.second;
        profile.monthly_averages[entry.first] = avg;
        averages.push_back(avg);
    }

    // Ties resolve to the earliest calendar month
    auto peak = profile.monthly_averages.begin();
    auto trough = profile.monthly_averages.begin();
    for (auto it = profile.monthly_averages.begin(); it != profile.monthly_averages.end(); ++it) {
        if (it->second > peak->second) peak = it;
        if (it->second < trough->second) trough = it;
    }

    profile.has_pattern = true;
    profile.peak_month = peak->first;
    profile.peak_price = peak->second;
    profile.trough_month = trough->first;
    profile.trough_price = trough->second;

    const double avg = Statistics::mean(averages);
    const double spread = Statistics::populationStdDev(averages, avg);
    profile.seasonal_strength = Statistics::coefficientOfVariation(spread, avg);
    profile.strength_label = seasonalStrengthLabel(profile.seasonal_strength);
    return profile;
}

std::optional<AnomalyEvent> MarketAnalytics::evaluatePoint(const PricePoint& point, double mean,
                                                           double std_dev, double sensitivity) {
    if (std_dev <= 0.0) {
        return std::nullopt;
    }

    const double z = (point.modal_price - mean) / std_dev;
    if (std::abs(z) <= sensitivity) {
        return std::nullopt;
    }

    AnomalyEvent event;
    event.date = point.date;
    event.market = point.market;
    event.price = point.modal_price;
    event.mean = mean;
    event.deviation_percent = (mean != 0.0) ? (point.modal_price - mean) / mean * 100.0 : 0.0;
    event.z_score = z;
    event.type = (z > 0.0) ? AnomalyType::SPIKE : AnomalyType::DROP;
    event.severity = (std::abs(z) > 3.0) ? AnomalySeverity::HIGH : AnomalySeverity::MODERATE;
    return event;
}

std::vector<AnomalyEvent> MarketAnalytics::computeAnomalies(std::vector<PricePoint> series,
                                                            double sensitivity) {
    std::vector<AnomalyEvent> events;
    if (series.size() < kMinAnomalyPoints) {
        return events;
    }

    sortByDate(series);
    const auto prices = modalPrices(series);
    const double mean = Statistics::mean(prices);
    const double std_dev = Statistics::populationStdDev(prices, mean);
    if (std_dev == 0.0) {
        return events;
    }

    for (const auto& point : series) {
        auto event = evaluatePoint(point, mean, std_dev, sensitivity);
        if (event) {
            events.push_back(*event);
        }
    }

    std::stable_sort(events.begin(), events.end(), [](const AnomalyEvent& a, const AnomalyEvent& b) {
        return std::abs(a.z_score) > std::abs(b.z_score);
    });
    return events;
}

MarketHealth MarketAnalytics::scoreHealth(const VolatilityProfile& volatility,
                                          const TrendProfile& trend,
                                          std::size_t anomaly_count) {
    int score = 100;

    switch (volatility.classification) {
        case VolatilityClass::VERY_HIGH: score -= 30; break;
        case VolatilityClass::HIGH: score -= 20; break;
        case VolatilityClass::MODERATE: score -= 10; break;
        default: break;
    }

    if (trend.direction == TrendDirection::DOWNWARD) {
        score -= 15;
    }

    score -= static_cast<int>(std::min<std::size_t>(anomaly_count * 5, 20));
    score = std::clamp(score, 0, 100);

    MarketHealth health;
    health.score = score;
    if (score >= 80) health.status = "EXCELLENT";
    else if (score >= 60) health.status = "GOOD";
    else if (score >= 40) health.status = "FAIR";
    else health.status = "POOR";
    return health;
}

// ===== Store-backed operations =====

VolatilityProfile MarketAnalytics::volatility(const std::string& commodity, const std::string& region,
                                              int window_days) const {
    return computeVolatility(store_.query(commodity, region, std::nullopt, window_days));
}

TrendProfile MarketAnalytics::trend(const std::string& commodity, const std::string& region,
                                    int window_days) const {
    return computeTrend(store_.query(commodity, region, std::nullopt, window_days));
}

SeasonalProfile MarketAnalytics::seasonality(const std::string& commodity,
                                             const std::optional<std::string>& region,
                                             int window_days) const {
    return computeSeasonality(store_.query(commodity, region, std::nullopt, window_days));
}

std::vector<AnomalyEvent> MarketAnalytics::anomalies(const std::string& commodity,
                                                     const std::string& region,
                                                     int window_days, double sensitivity) const {
    return computeAnomalies(store_.query(commodity, region, std::nullopt, window_days), sensitivity);
}

std::vector<MarketQuote> MarketAnalytics::compareMarkets(const std::string& commodity,
                                                         const std::string& region,
                                                         std::size_t top_n, int window_days) const {
    const auto prices = store_.query(commodity, region, std::nullopt, window_days);
    if (prices.empty()) {
        return {};
    }

    // Ascending by date, so the last write per market is its latest quote
    std::map<std::string, PricePoint> latest;
    for (const auto& p : prices) {
        latest[utils::normalizeName(p.market)] = p;
    }

    std::vector<double> latest_prices;
    for (const auto& entry : latest) {
        latest_prices.push_back(entry.second.modal_price);
    }
    const double avg = Statistics::mean(latest_prices);

    std::vector<MarketQuote> quotes;
    for (const auto& entry : latest) {
        const auto& p = entry.second;
        MarketQuote quote;
        quote.market = p.market;
        quote.district = p.district;
        quote.date = p.date;
        quote.modal_price = p.modal_price;
        quote.min_price = p.min_price;
        quote.max_price = p.max_price;
        quote.diff_from_avg_percent = percentChange(avg, p.modal_price);
        if (quote.diff_from_avg_percent > 0.0) quote.price_status = "ABOVE_AVG";
        else if (quote.diff_from_avg_percent < 0.0) quote.price_status = "BELOW_AVG";
        else quote.price_status = "AVERAGE";
        quotes.push_back(std::move(quote));
    }

    std::stable_sort(quotes.begin(), quotes.end(), [](const MarketQuote& a, const MarketQuote& b) {
        return a.modal_price > b.modal_price;
    });
    if (quotes.size() > top_n) {
        quotes.resize(top_n);
    }
    return quotes;
}

TopMovers MarketAnalytics::topMovers(const std::string& region, int window_days,
                                     std::size_t top_n) const {
    std::vector<CommodityMove> moves;
    for (const auto& commodity : store_.commoditiesInRegion(region)) {
        const auto series = store_.query(commodity, region, std::nullopt, window_days);
        if (series.size() < 2) continue;

        const double first = series.front().modal_price;
        const double last = series.back().modal_price;
        if (first <= 0.0) continue;

        CommodityMove move;
        move.commodity = commodity;
        move.first_price = first;
        move.last_price = last;
        move.change_percent = percentChange(first, last);
        move.change_amount = last - first;
        moves.push_back(std::move(move));
    }

    TopMovers movers;
    movers.gainers = moves;
    std::stable_sort(movers.gainers.begin(), movers.gainers.end(),
                     [](const CommodityMove& a, const CommodityMove& b) {
                         return a.change_percent > b.change_percent;
                     });
    movers.losers = moves;
    std::stable_sort(movers.losers.begin(), movers.losers.end(),
                     [](const CommodityMove& a, const CommodityMove& b) {
                         return a.change_percent < b.change_percent;
                     });
    if (movers.gainers.size() > top_n) movers.gainers.resize(top_n);
    if (movers.losers.size() > top_n) movers.losers.resize(top_n);
    return movers;
}

MarketReport MarketAnalytics::marketReport(const std::string& commodity, const std::string& region,
                                           int window_days) const {
    MarketReport report;
    report.commodity = commodity;
    report.region = region;
    report.window_days = window_days;
    report.volatility = volatility(commodity, region, window_days);
    report.trend = trend(commodity, region, window_days);
    report.seasonal = seasonality(commodity, region);

    const auto all_anomalies = anomalies(commodity, region, window_days);
    report.health = scoreHealth(report.volatility, report.trend, all_anomalies.size());
    report.anomalies.assign(all_anomalies.begin(),
                            all_anomalies.begin() + std::min<std::ptrdiff_t>(3, all_anomalies.size()));
    report.top_markets = compareMarkets(commodity, region, 5);
    report.generated_at_ms = utils::DateUtils::nowMs();

    LOG_INFO("Market report {} / {}: health {} ({}), {} anomalies",
             commodity, region, report.health.score, report.health.status, all_anomalies.size());
    return report;
}

std::string toString(VolatilityClass value) {
    switch (value) {
        case VolatilityClass::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case VolatilityClass::LOW: return "LOW";
        case VolatilityClass::MODERATE: return "MODERATE";
        case VolatilityClass::HIGH: return "HIGH";
        case VolatilityClass::VERY_HIGH: return "VERY_HIGH";
    }
    return "INSUFFICIENT_DATA";
}

std::string toString(TrendDirection value) {
    switch (value) {
        case TrendDirection::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case TrendDirection::STABLE: return "STABLE";
        case TrendDirection::UPWARD: return "UPWARD";
        case TrendDirection::DOWNWARD: return "DOWNWARD";
    }
    return "INSUFFICIENT_DATA";
}

std::string toString(AnomalyType value) {
    return value == AnomalyType::SPIKE ? "SPIKE" : "DROP";
}

std::string toString(AnomalySeverity value) {
    return value == AnomalySeverity::HIGH ? "HIGH" : "MODERATE";
}

} // namespace analytics
} // namespace harvestcast
