#include "common/Errors.h"
#include "common/SeriesKey.h"
#include "core/state/ModelArtifactStoreJson.h"
#include "forecast/EnsembleForecaster.h"
#include "forecast/SeasonalTrendModel.h"

#include <atomic>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace harvestcast;
using namespace harvestcast::forecast;

static int fail(const std::string& message) {
    std::cerr << "[TEST] " << message << "\n";
    return 1;
}

static std::vector<SeriesSample> linearSeries(std::size_t n, double base, double slope) {
    std::vector<SeriesSample> out;
    for (std::size_t i = 0; i < n; ++i) {
        SeriesSample s;
        s.date = 19000 + static_cast<int>(i);
        s.price = base + slope * static_cast<double>(i);
        out.push_back(s);
    }
    return out;
}

static bool sameForecast(const Forecast& a, const Forecast& b) {
    if (a.points.size() != b.points.size() || a.trend != b.trend) {
        return false;
    }
    for (std::size_t i = 0; i < a.points.size(); ++i) {
        const auto& x = a.points[i];
        const auto& y = b.points[i];
        if (x.date != y.date ||
            std::abs(x.point_estimate - y.point_estimate) > 1e-9 ||
            std::abs(x.lower_bound - y.lower_bound) > 1e-9 ||
            std::abs(x.upper_bound - y.upper_bound) > 1e-9) {
            return false;
        }
    }
    return true;
}

// One writer keeps swapping between two series while readers predict.
// Every forecast must come from one complete model.
static int testRetrainWhilePredicting() {
    const SeriesKey key = SeriesKey::make("Maize", "Bihar");
    const auto rising = linearSeries(90, 1500.0, 4.0);
    const auto falling = linearSeries(90, 2500.0, -3.0);

    EnsembleForecaster forecaster(nullptr);
    forecaster.train(rising, key);
    const auto rising_ref = forecaster.predict(key, 10);
    forecaster.train(falling, key);
    const auto falling_ref = forecaster.predict(key, 10);
    if (sameForecast(rising_ref, falling_ref)) {
        return fail("reference series should forecast differently");
    }

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> reads{0};

    std::thread writer([&]() {
        for (int i = 0; i < 200; ++i) {
            forecaster.train(i % 2 == 0 ? rising : falling, key);
        }
        done = true;
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&]() {
            while (!done) {
                const auto forecast = forecaster.predict(key, 10);
                if (!sameForecast(forecast, rising_ref) && !sameForecast(forecast, falling_ref)) {
                    ++torn;
                }
                ++reads;
            }
        });
    }

    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }

    if (torn != 0) {
        return fail("predict observed a partially replaced model (" + std::to_string(torn.load()) +
                    " of " + std::to_string(reads.load()) + " reads)");
    }
    if (!sameForecast(forecaster.predict(key, 10), falling_ref)) {
        return fail("last retrain should be the one served");
    }
    return 0;
}

int main() {
    const auto model_dir = std::filesystem::temp_directory_path() / "harvestcast_test_models";
    std::error_code ec;
    std::filesystem::remove_all(model_dir, ec);

    auto store = std::make_shared<core::ModelArtifactStoreJson>(model_dir);
    EnsembleForecaster forecaster(store);
    const SeriesKey key = SeriesKey::make("Wheat", "Punjab");
    const SeriesKey other = SeriesKey::make("Onion", "Punjab");

    // Unknown key
    try {
        forecaster.predict(other, 7);
        return fail("predict on an untrained key should throw");
    } catch (const ModelUnavailableError& e) {
        if (e.key() != other.str()) {
            return fail("ModelUnavailableError carries the wrong key");
        }
    }

    // Below minimum sample size
    try {
        forecaster.train(linearSeries(29, 1000.0, 5.0), key);
        return fail("29 points should be rejected");
    } catch (const InsufficientDataError& e) {
        if (e.got() != 29 || e.required() != 30) {
            return fail("InsufficientDataError counts mismatch");
        }
    }
    if (forecaster.hasModel(key)) {
        return fail("failed train must not publish a model");
    }

    const auto series = linearSeries(120, 1000.0, 5.0);
    if (!forecaster.train(series, key)) {
        return fail("train should succeed");
    }

    const auto forecast = forecaster.predict(key, 7);
    if (forecast.points.size() != 7) {
        return fail("horizon length mismatch");
    }
    DayNumber previous = series.back().date;
    for (const auto& p : forecast.points) {
        if (p.date != previous + 1) {
            return fail("forecast dates must be consecutive days after the training window");
        }
        previous = p.date;
        if (std::abs(p.contributing_models.weightSum() - 1.0) > 1e-9) {
            return fail("contributing weights must sum to 1");
        }
        if (!(p.lower_bound <= p.point_estimate && p.point_estimate <= p.upper_bound)) {
            return fail("interval must contain the point estimate");
        }
        if (p.upper_bound - p.point_estimate < 0.05 * p.point_estimate - 1e-6) {
            return fail("interval must be at least +/-5%");
        }
    }
    if (!forecast.seasonalParticipated()) {
        return fail("seasonal sub-model should participate on a 120-day window");
    }
    if (forecast.trend != ForecastTrend::RISING) {
        return fail("linear uptrend should forecast RISING, got " + toString(forecast.trend));
    }

    // Failed retrain keeps the prior artifact
    const auto before = forecaster.model(key);
    try {
        forecaster.train(linearSeries(10, 1.0, 0.0), key);
        return fail("short retrain should throw");
    } catch (const InsufficientDataError&) {
    }
    if (forecaster.model(key) != before) {
        return fail("failed retrain replaced the model");
    }

    // Train twice on the same data: same forecast
    forecaster.train(series, key);
    const auto again = forecaster.predict(key, 7);
    for (std::size_t i = 0; i < again.points.size(); ++i) {
        if (std::abs(again.points[i].point_estimate - forecast.points[i].point_estimate) > 1e-9) {
            return fail("retraining on identical data changed the forecast");
        }
    }

    if (!forecaster.predict(key, 0).points.empty()) {
        return fail("horizon 0 should be empty");
    }
    const auto single = forecaster.predict(key, 1);
    if (single.points.size() != 1 || single.trend != ForecastTrend::UNKNOWN) {
        return fail("single-point horizon should have UNKNOWN trend");
    }

    // A fresh forecaster over the same directory promotes the stored artifact
    EnsembleForecaster restarted(store);
    const auto restored = restarted.predict(key, 7);
    for (std::size_t i = 0; i < restored.points.size(); ++i) {
        if (std::abs(restored.points[i].point_estimate - forecast.points[i].point_estimate) > 1e-6) {
            return fail("restored model forecasts differ");
        }
    }
    if (restarted.registry().size() != 1) {
        return fail("backing store hit should be promoted into memory");
    }
    const auto info = restarted.modelInfo(key);
    if (!info || info->sample_size != 120 || !info->seasonal_available) {
        return fail("modelInfo mismatch");
    }

    // Seasonal disabled: linear 0.75 + moving average 0.25, plain +/-5% band
    ForecastConfig no_seasonal;
    no_seasonal.seasonal.enabled = false;
    EnsembleForecaster plain(nullptr, no_seasonal);
    plain.train(series, key);
    const auto narrow = plain.predict(key, 3);
    const auto& first = narrow.points.front();
    if (first.contributing_models.seasonal_trend ||
        std::abs(first.contributing_models.linear_weight - 0.75) > 1e-9 ||
        std::abs(first.contributing_models.moving_average_weight - 0.25) > 1e-9) {
        return fail("weights should renormalize without the seasonal sub-model");
    }
    const double ma = (1000.0 + 5.0 * 113 + 1000.0 + 5.0 * 119) / 2.0;
    const double expected = 0.75 * (1000.0 + 5.0 * 120) + 0.25 * ma;
    if (std::abs(first.point_estimate - expected) > 1e-6) {
        return fail("blended estimate mismatch");
    }
    if (std::abs(first.upper_bound - expected * 1.05) > 1e-6 ||
        std::abs(first.lower_bound - expected * 0.95) > 1e-6) {
        return fail("fallback band should be exactly +/-5%");
    }

    // Seasonal sub-model recovers a yearly cycle
    std::vector<SeriesSample> cycle;
    const double pi = 3.14159265358979323846;
    for (int t = 0; t < 730; ++t) {
        SeriesSample s;
        s.date = 18000 + t;
        s.price = 1000.0 + 100.0 * std::sin(2.0 * pi * t / 365.25);
        cycle.push_back(s);
    }
    const auto params = SeasonalTrendModel::fit(cycle, SeasonalConfig());
    if (!params.available) {
        return fail("seasonal fit should be available on two years of data");
    }
    const int ahead = 91;
    const auto estimate = SeasonalTrendModel::predict(params, 18000 + 729 + ahead, ahead);
    const double truth = 1000.0 + 100.0 * std::sin(2.0 * pi * (729 + ahead) / 365.25);
    if (!estimate || std::abs(estimate->value - truth) > 20.0) {
        return fail("seasonal extrapolation too far from the true cycle");
    }

    SeasonalConfig short_span;
    short_span.min_span_days = 60;
    if (SeasonalTrendModel::fit(linearSeries(40, 100.0, 1.0), short_span).available) {
        return fail("short training span should leave the seasonal sub-model unavailable");
    }

    if (testRetrainWhilePredicting() != 0) {
        return 1;
    }

    std::filesystem::remove_all(model_dir, ec);
    std::cout << "[TEST] EnsembleForecaster PASSED\n";
    return 0;
}
