#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/Types.h"
#include "data/TimeSeriesStore.h"

namespace harvestcast {
namespace analytics {

enum class VolatilityClass {
    INSUFFICIENT_DATA,
    LOW,            // CV < 5
    MODERATE,       // CV < 10
    HIGH,           // CV < 15
    VERY_HIGH
};

struct VolatilityProfile {
    double std_dev = 0.0;
    double mean = 0.0;
    double coefficient_of_variation = 0.0;
    VolatilityClass classification = VolatilityClass::INSUFFICIENT_DATA;
    std::size_t sample_size = 0;
};

enum class TrendDirection {
    INSUFFICIENT_DATA,
    STABLE,         // |change| < 2%
    UPWARD,
    DOWNWARD
};

struct TrendProfile {
    TrendDirection direction = TrendDirection::INSUFFICIENT_DATA;
    double strength = 0.0;          // |change_percent|
    double change_percent = 0.0;
    double slope = 0.0;             // price per observation
    double first_price = 0.0;
    double last_price = 0.0;
    std::string strength_label;     // weak / moderate / strong / very strong
    std::size_t sample_size = 0;
};

struct SeasonalProfile {
    bool has_pattern = false;
    int peak_month = 0;
    double peak_price = 0.0;
    int trough_month = 0;
    double trough_price = 0.0;
    std::map<int, double> monthly_averages;     // month 1..12 -> mean modal price
    double seasonal_strength = 0.0;
    std::string strength_label;                 // weak / moderate / strong
};

enum class AnomalyType { SPIKE, DROP };
enum class AnomalySeverity { MODERATE, HIGH };

struct AnomalyEvent {
    DayNumber date = 0;
    std::string market;
    double price = 0.0;
    double mean = 0.0;
    double deviation_percent = 0.0;
    double z_score = 0.0;
    AnomalyType type = AnomalyType::SPIKE;
    AnomalySeverity severity = AnomalySeverity::MODERATE;
};

struct MarketQuote {
    std::string market;
    std::string district;
    DayNumber date = 0;
    double modal_price = 0.0;
    double min_price = 0.0;
    double max_price = 0.0;
    double diff_from_avg_percent = 0.0;
    std::string price_status;       // ABOVE_AVG / BELOW_AVG / AVERAGE
};

struct CommodityMove {
    std::string commodity;
    double first_price = 0.0;
    double last_price = 0.0;
    double change_percent = 0.0;
    double change_amount = 0.0;
};

struct TopMovers {
    std::vector<CommodityMove> gainers;
    std::vector<CommodityMove> losers;
};

struct MarketHealth {
    int score = 0;
    std::string status;             // EXCELLENT / GOOD / FAIR / POOR
};

struct MarketReport {
    std::string commodity;
    std::string region;
    int window_days = 0;
    MarketHealth health;
    VolatilityProfile volatility;
    TrendProfile trend;
    SeasonalProfile seasonal;
    std::vector<AnomalyEvent> anomalies;        // top 3 by |z|
    std::vector<MarketQuote> top_markets;       // top 5 by price
    long long generated_at_ms = 0;
};

// Market analytics over series served by a TimeSeriesStore.
// The static compute* functions work on any series and sort it by date first.
class MarketAnalytics {
public:
    static constexpr std::size_t kMinVolatilityPoints = 5;
    static constexpr std::size_t kMinTrendPoints = 7;
    static constexpr std::size_t kMinAnomalyPoints = 10;

    explicit MarketAnalytics(const data::TimeSeriesStore& store);

    VolatilityProfile volatility(const std::string& commodity, const std::string& region,
                                 int window_days = 30) const;
    TrendProfile trend(const std::string& commodity, const std::string& region,
                       int window_days = 30) const;
    SeasonalProfile seasonality(const std::string& commodity,
                                const std::optional<std::string>& region = std::nullopt,
                                int window_days = 365) const;
    std::vector<AnomalyEvent> anomalies(const std::string& commodity, const std::string& region,
                                        int window_days = 30, double sensitivity = 2.0) const;

    std::vector<MarketQuote> compareMarkets(const std::string& commodity, const std::string& region,
                                            std::size_t top_n = 5, int window_days = 30) const;
    TopMovers topMovers(const std::string& region, int window_days = 30,
                        std::size_t top_n = 5) const;
    MarketReport marketReport(const std::string& commodity, const std::string& region,
                              int window_days = 30) const;

    static VolatilityProfile computeVolatility(std::vector<PricePoint> series);
    static TrendProfile computeTrend(std::vector<PricePoint> series);
    static SeasonalProfile computeSeasonality(const std::vector<PricePoint>& series);
    static std::vector<AnomalyEvent> computeAnomalies(std::vector<PricePoint> series,
                                                      double sensitivity = 2.0);

    static VolatilityClass classifyVolatility(double coefficient_of_variation);
    static TrendDirection classifyTrend(double change_percent);
    static std::string trendStrengthLabel(double strength);
    static std::string seasonalStrengthLabel(double seasonal_strength);

    // Flags one observation against a population mean/std; nullopt when |z| <= sensitivity
    static std::optional<AnomalyEvent> evaluatePoint(const PricePoint& point, double mean,
                                                     double std_dev, double sensitivity);

    static MarketHealth scoreHealth(const VolatilityProfile& volatility,
                                    const TrendProfile& trend,
                                    std::size_t anomaly_count);

private:
    const data::TimeSeriesStore& store_;
};

std::string toString(VolatilityClass value);
std::string toString(TrendDirection value);
std::string toString(AnomalyType value);
std::string toString(AnomalySeverity value);

} // namespace analytics
} // namespace harvestcast
