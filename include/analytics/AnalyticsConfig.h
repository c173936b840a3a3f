#pragma once

namespace harvestcast {
namespace analytics {

// Default look-back windows used by callers of MarketAnalytics
struct AnalyticsConfig {
    int volatility_window_days = 30;
    int trend_window_days = 30;
    int seasonal_window_days = 365;
    int anomaly_window_days = 30;
    double anomaly_sensitivity = 2.0;   // std-devs
    int comparison_window_days = 30;
    int top_n = 5;
};

} // namespace analytics
} // namespace harvestcast
