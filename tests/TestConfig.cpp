#include "common/Config.h"

#include <cassert>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

// Simple manual test runner
int main() {
    using namespace harvestcast;

    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. Defaults
    Config defaults;
    assert(defaults.getForecastConfig().min_train_points == 30);
    assert(defaults.getForecastConfig().ma_window == 7);
    assert(std::abs(defaults.getForecastConfig().weights.seasonal - 0.6) < 1e-12);
    assert(defaults.getAnalyticsConfig().volatility_window_days == 30);
    if (defaults.getDataConfig().model_dir != "models") {
        std::cerr << "[TEST] default model_dir mismatch\n";
        return 1;
    }

    // 2. Load a file with partial overrides
    const auto dir = std::filesystem::temp_directory_path() / "harvestcast_test_config";
    std::filesystem::create_directories(dir);
    const auto path = dir / "config.json";
    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({
            "data": { "model_dir": "/var/lib/harvestcast/models" },
            "forecast": {
                "min_train_points": 45,
                "weights": { "seasonal": 0.5 },
                "seasonal": { "enabled": false, "fourier_order": 5 }
            },
            "analytics": { "anomaly_sensitivity": 2.5 }
        })";
    }

    unsetenv("HARVESTCAST_PRICES_CSV");
    Config config;
    if (!config.load(path.string())) {
        std::cerr << "[TEST] load failed\n";
        return 1;
    }
    const auto& fc = config.getForecastConfig();
    if (fc.min_train_points != 45 || fc.seasonal.enabled || fc.seasonal.fourier_order != 5) {
        std::cerr << "[TEST] forecast overrides not applied\n";
        return 1;
    }
    // Untouched keys keep their defaults
    assert(std::abs(fc.weights.linear - 0.3) < 1e-12);
    assert(std::abs(fc.weights.seasonal - 0.5) < 1e-12);
    assert(std::abs(config.getAnalyticsConfig().anomaly_sensitivity - 2.5) < 1e-12);
    assert(config.getDataConfig().model_dir == "/var/lib/harvestcast/models");
    assert(config.getDataConfig().prices_csv == "data/agmarknet_prices.csv");

    // 3. Environment override
    setenv("HARVESTCAST_PRICES_CSV", "/tmp/prices.csv", 1);
    Config env_config;
    env_config.load(path.string());
    unsetenv("HARVESTCAST_PRICES_CSV");
    if (env_config.getDataConfig().prices_csv != "/tmp/prices.csv") {
        std::cerr << "[TEST] HARVESTCAST_PRICES_CSV override not applied\n";
        return 1;
    }

    // 4. Parse error keeps defaults and reports failure
    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ \"forecast\": ";
    }
    Config broken;
    if (broken.load(path.string())) {
        std::cerr << "[TEST] malformed config should report failure\n";
        return 1;
    }
    assert(broken.getForecastConfig().min_train_points == 30);

    // 5. Missing file is not an error
    Config missing;
    if (!missing.load((dir / "absent.json").string())) {
        std::cerr << "[TEST] missing config should fall back to defaults\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
