#include "analytics/MarketAnalytics.h"
#include "common/DateUtils.h"
#include "data/TimeSeriesStore.h"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace harvestcast;
using namespace harvestcast::analytics;

static int fail(const std::string& message) {
    std::cerr << "[TEST] " << message << "\n";
    return 1;
}

static std::vector<PricePoint> makeSeries(const std::vector<double>& prices, DayNumber start,
                                          const std::string& market = "Khanna") {
    std::vector<PricePoint> out;
    for (std::size_t i = 0; i < prices.size(); ++i) {
        out.emplace_back("Wheat", "Punjab", market, start + static_cast<int>(i),
                         prices[i], prices[i], prices[i]);
    }
    return out;
}

int main() {
    // Classification boundaries
    if (MarketAnalytics::classifyVolatility(3.0) != VolatilityClass::LOW ||
        MarketAnalytics::classifyVolatility(7.0) != VolatilityClass::MODERATE ||
        MarketAnalytics::classifyVolatility(12.0) != VolatilityClass::HIGH ||
        MarketAnalytics::classifyVolatility(20.0) != VolatilityClass::VERY_HIGH) {
        return fail("volatility classification boundaries");
    }
    if (MarketAnalytics::classifyTrend(1.5) != TrendDirection::STABLE ||
        MarketAnalytics::classifyTrend(6.0) != TrendDirection::UPWARD ||
        MarketAnalytics::classifyTrend(-6.0) != TrendDirection::DOWNWARD) {
        return fail("trend classification boundaries");
    }

    // Anomaly classification at exact z-scores
    PricePoint candidate("Wheat", "Punjab", "Khanna", 0, 0, 0, 125.0);
    auto moderate = MarketAnalytics::evaluatePoint(candidate, 100.0, 10.0, 2.0);
    if (!moderate || moderate->type != AnomalyType::SPIKE ||
        moderate->severity != AnomalySeverity::MODERATE) {
        return fail("z=2.5 should be a MODERATE SPIKE");
    }
    candidate.modal_price = 135.0;
    auto high = MarketAnalytics::evaluatePoint(candidate, 100.0, 10.0, 2.0);
    if (!high || high->severity != AnomalySeverity::HIGH) {
        return fail("z=3.5 should be HIGH");
    }
    candidate.modal_price = 75.0;
    auto drop = MarketAnalytics::evaluatePoint(candidate, 100.0, 10.0, 2.0);
    if (!drop || drop->type != AnomalyType::DROP || std::abs(drop->deviation_percent + 25.0) > 1e-9) {
        return fail("z=-2.5 should be a DROP of -25%");
    }
    candidate.modal_price = 120.0;
    if (MarketAnalytics::evaluatePoint(candidate, 100.0, 10.0, 2.0)) {
        return fail("|z| equal to sensitivity is not an anomaly");
    }

    const DayNumber today = utils::DateUtils::fromCivil(2024, 6, 30);
    data::TimeSeriesStore store([today]() { return today; });

    // 19 quiet days and one spike: population z ~ 4.36
    std::vector<double> spiky(19, 100.0);
    spiky.push_back(200.0);
    store.ingest(makeSeries(spiky, today - 19));

    MarketAnalytics analytics(store);
    const auto events = analytics.anomalies("Wheat", "Punjab", 30, 2.0);
    if (events.size() != 1) {
        return fail("expected exactly one anomaly, got " + std::to_string(events.size()));
    }
    if (events.front().type != AnomalyType::SPIKE || events.front().severity != AnomalySeverity::HIGH ||
        std::abs(events.front().z_score - 4.3589) > 1e-3) {
        return fail("spike z-score/severity mismatch");
    }

    // Too few points for anything but seasonality
    const auto few = makeSeries({100, 101, 102, 103}, today - 3);
    if (MarketAnalytics::computeVolatility(few).classification != VolatilityClass::INSUFFICIENT_DATA) {
        return fail("4 points should be INSUFFICIENT_DATA for volatility");
    }
    if (MarketAnalytics::computeTrend(few).direction != TrendDirection::INSUFFICIENT_DATA) {
        return fail("4 points should be INSUFFICIENT_DATA for trend");
    }
    if (!MarketAnalytics::computeAnomalies(few).empty()) {
        return fail("4 points should yield no anomalies");
    }

    // Constant series: CV 0, no anomalies
    const auto flat = makeSeries(std::vector<double>(12, 500.0), today - 11);
    const auto flat_vol = MarketAnalytics::computeVolatility(flat);
    if (flat_vol.classification != VolatilityClass::LOW || flat_vol.coefficient_of_variation != 0.0) {
        return fail("constant series should be LOW with CV 0");
    }
    if (!MarketAnalytics::computeAnomalies(flat).empty()) {
        return fail("constant series should have no anomalies");
    }

    // Trend is first vs last, order-independent of input order
    auto rising = makeSeries({100, 101, 102, 103, 104, 105, 106}, today - 6);
    std::swap(rising.front(), rising.back());
    const auto trend = MarketAnalytics::computeTrend(rising);
    if (trend.direction != TrendDirection::UPWARD || std::abs(trend.change_percent - 6.0) > 1e-9 ||
        trend.strength_label != "moderate" || trend.slope <= 0.0) {
        return fail("rising trend mismatch");
    }

    // Seasonality: prices peak in March, trough in September
    std::vector<PricePoint> yearly;
    for (int month = 1; month <= 12; ++month) {
        double price = 1000.0;
        if (month == 3) price = 1400.0;
        if (month == 9) price = 700.0;
        yearly.emplace_back("Wheat", "Punjab", "Khanna",
                            utils::DateUtils::fromCivil(2023, month, 15), price, price, price);
    }
    const auto seasonal = MarketAnalytics::computeSeasonality(yearly);
    if (!seasonal.has_pattern || seasonal.peak_month != 3 || seasonal.trough_month != 9 ||
        seasonal.monthly_averages.size() != 12 || seasonal.strength_label != "strong") {
        return fail("seasonality peak/trough mismatch");
    }
    if (MarketAnalytics::computeSeasonality({}).has_pattern) {
        return fail("empty series should have no seasonal pattern");
    }

    // Health score
    VolatilityProfile very_high;
    very_high.classification = VolatilityClass::VERY_HIGH;
    TrendProfile downward;
    downward.direction = TrendDirection::DOWNWARD;
    const auto health = MarketAnalytics::scoreHealth(very_high, downward, 10);
    if (health.score != 35 || health.status != "POOR") {
        return fail("health score should be 35/POOR, got " + std::to_string(health.score));
    }

    // Market comparison and movers over the store
    store.ingest(makeSeries({150, 160}, today - 1, "Ludhiana"));
    store.ingest({
        PricePoint("Onion", "Punjab", "Khanna", today - 5, 1000, 1000, 1000),
        PricePoint("Onion", "Punjab", "Khanna", today - 1, 800, 800, 800),
    });

    const auto quotes = analytics.compareMarkets("Wheat", "Punjab", 5, 30);
    if (quotes.size() != 2 || quotes.front().market != "Khanna" ||
        quotes.front().price_status != "ABOVE_AVG" || quotes.back().price_status != "BELOW_AVG") {
        return fail("compareMarkets should rank latest quotes by price");
    }
    if (std::abs(quotes.front().diff_from_avg_percent - 11.1111) > 1e-3) {
        return fail("diff_from_avg_percent mismatch");
    }
    if (analytics.compareMarkets("Wheat", "Punjab", 1, 30).size() != 1) {
        return fail("compareMarkets should honor top_n");
    }

    const auto movers = analytics.topMovers("Punjab", 30, 5);
    if (movers.gainers.empty() || movers.gainers.front().commodity != "Wheat" ||
        movers.losers.front().commodity != "Onion" ||
        std::abs(movers.losers.front().change_percent + 20.0) > 1e-9) {
        return fail("topMovers ordering mismatch");
    }

    const auto report = analytics.marketReport("Wheat", "Punjab", 30);
    if (report.anomalies.size() > 3 || report.top_markets.empty() ||
        report.health.score < 0 || report.health.score > 100) {
        return fail("marketReport bounds");
    }

    if (!analytics.anomalies("Rice", "Punjab", 30, 2.0).empty() ||
        analytics.volatility("Rice", "Punjab", 30).classification != VolatilityClass::INSUFFICIENT_DATA) {
        return fail("unknown commodity should produce sentinels, not errors");
    }

    std::cout << "[TEST] MarketAnalytics PASSED\n";
    return 0;
}
