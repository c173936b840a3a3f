#pragma once

#include <cstddef>

namespace harvestcast {
namespace forecast {

// Yearly Fourier + linear trend sub-model
struct SeasonalConfig {
    bool enabled = true;
    int fourier_order = 3;              // sin/cos pairs
    double period_days = 365.25;
    double prior_scale = 10.0;          // ridge penalty = 1 / prior_scale^2 on Fourier terms
    int min_span_days = 28;             // shorter training windows leave the sub-model unavailable
    double interval_z = 1.6448536;      // 90% two-sided
};

// Base ensemble weights, renormalized over whichever sub-models are available
struct EnsembleWeights {
    double seasonal = 0.6;
    double linear = 0.3;
    double moving_average = 0.1;
};

struct ForecastConfig {
    std::size_t min_train_points = 30;
    std::size_t ma_window = 7;
    int default_horizon_days = 7;
    int training_window_days = 365;
    double fallback_band_pct = 0.05;    // +/- band when no seasonal interval exists
    EnsembleWeights weights;
    SeasonalConfig seasonal;
};

} // namespace forecast
} // namespace harvestcast
