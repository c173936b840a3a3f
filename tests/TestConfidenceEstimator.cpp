#include "forecast/ConfidenceEstimator.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using namespace harvestcast;
using namespace harvestcast::forecast;

static std::vector<SeriesSample> history(std::size_t n, double low, double high) {
    std::vector<SeriesSample> out;
    for (std::size_t i = 0; i < n; ++i) {
        SeriesSample s;
        s.date = static_cast<int>(i);
        s.price = (i % 2 == 0) ? low : high;
        out.push_back(s);
    }
    return out;
}

static Forecast forecastWithSeasonal(bool seasonal) {
    Forecast f;
    ForecastPoint p;
    p.contributing_models.seasonal_trend = seasonal;
    p.contributing_models.linear_trend = true;
    f.points.push_back(p);
    return f;
}

int main() {
    ConfidenceEstimator estimator;
    const Forecast plain = forecastWithSeasonal(false);
    const Forecast seasonal = forecastWithSeasonal(true);

    struct Case {
        std::size_t n;
        double low;
        double high;
        const Forecast* forecast;
        int expected;
    };

    const std::vector<Case> cases = {
        {100, 100.0, 100.0, &plain, 100},       // large, flat
        {100, 100.0, 100.0, &seasonal, 100},    // bonus clamps at 100
        {20, 100.0, 100.0, &plain, 60},         // < 30 points
        {45, 100.0, 100.0, &plain, 80},         // < 60 points
        {75, 100.0, 100.0, &seasonal, 100},     // < 90 points, +10
        {100, 80.0, 120.0, &plain, 70},         // CV ~20% -> -30
        {100, 88.0, 112.0, &plain, 80},         // CV ~12% -> -20
        {100, 93.0, 107.0, &plain, 90},         // CV ~7% -> -10
        {10, 50.0, 150.0, &plain, 30},          // worst case
        {0, 0.0, 0.0, &plain, 60},              // empty history, mean 0 -> CV 0
    };

    for (const auto& c : cases) {
        const int score = estimator.score(history(c.n, c.low, c.high), *c.forecast);
        assert(score >= 0 && score <= 100);
        if (score != c.expected) {
            std::cerr << "[TEST] n=" << c.n << " low=" << c.low << " high=" << c.high
                      << " expected " << c.expected << ", got " << score << "\n";
            return 1;
        }
    }

    std::cout << "[TEST] ConfidenceEstimator PASSED\n";
    return 0;
}
