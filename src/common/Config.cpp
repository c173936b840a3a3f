#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace harvestcast {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}
}

bool Config::load(const std::string& path) {
    const std::filesystem::path config_path = utils::PathUtils::resolveRelativePath(path);
    std::cout << "Config file: " << config_path << std::endl;

    bool ok = true;
    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults." << std::endl;
    } else {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "Warning: config file could not be opened, using defaults." << std::endl;
        } else {
            try {
                nlohmann::json j;
                file >> j;
                apply(j);
            } catch (const nlohmann::json::exception& e) {
                std::cerr << "Config load error: " << e.what() << std::endl;
                ok = false;
            }
        }
    }

    const std::string csv_override = readEnvVar("HARVESTCAST_PRICES_CSV");
    if (!csv_override.empty()) {
        data_.prices_csv = csv_override;
    }

    std::cout << "Config loaded: prices=" << data_.prices_csv
              << ", models=" << data_.model_dir
              << ", min_train_points=" << forecast_.min_train_points << std::endl;
    return ok;
}

void Config::apply(const nlohmann::json& j) {
    if (j.contains("data")) {
        const auto& d = j["data"];
        data_.prices_csv = d.value("prices_csv", data_.prices_csv);
        data_.model_dir = d.value("model_dir", data_.model_dir);
        data_.journal_path = d.value("journal_path", data_.journal_path);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        logging_.dir = l.value("dir", logging_.dir);
        logging_.level = l.value("level", logging_.level);
    }

    if (j.contains("forecast")) {
        const auto& f = j["forecast"];
        forecast_.min_train_points = f.value("min_train_points", forecast_.min_train_points);
        forecast_.ma_window = f.value("ma_window", forecast_.ma_window);
        forecast_.default_horizon_days = f.value("horizon_default", forecast_.default_horizon_days);
        forecast_.training_window_days = f.value("training_window_days", forecast_.training_window_days);
        forecast_.fallback_band_pct = f.value("fallback_band_pct", forecast_.fallback_band_pct);

        if (f.contains("weights")) {
            const auto& w = f["weights"];
            forecast_.weights.seasonal = w.value("seasonal", forecast_.weights.seasonal);
            forecast_.weights.linear = w.value("linear", forecast_.weights.linear);
            forecast_.weights.moving_average = w.value("moving_average", forecast_.weights.moving_average);
        }

        if (f.contains("seasonal")) {
            const auto& s = f["seasonal"];
            forecast_.seasonal.enabled = s.value("enabled", forecast_.seasonal.enabled);
            forecast_.seasonal.fourier_order = s.value("fourier_order", forecast_.seasonal.fourier_order);
            forecast_.seasonal.period_days = s.value("period_days", forecast_.seasonal.period_days);
            forecast_.seasonal.prior_scale = s.value("prior_scale", forecast_.seasonal.prior_scale);
            forecast_.seasonal.min_span_days = s.value("min_span_days", forecast_.seasonal.min_span_days);
            forecast_.seasonal.interval_z = s.value("interval_z", forecast_.seasonal.interval_z);
        }
    }

    if (j.contains("analytics")) {
        const auto& a = j["analytics"];
        analytics_.volatility_window_days = a.value("volatility_window", analytics_.volatility_window_days);
        analytics_.trend_window_days = a.value("trend_window", analytics_.trend_window_days);
        analytics_.seasonal_window_days = a.value("seasonal_window", analytics_.seasonal_window_days);
        analytics_.anomaly_window_days = a.value("anomaly_window", analytics_.anomaly_window_days);
        analytics_.anomaly_sensitivity = a.value("anomaly_sensitivity", analytics_.anomaly_sensitivity);
        analytics_.comparison_window_days = a.value("comparison_window", analytics_.comparison_window_days);
        analytics_.top_n = a.value("top_n", analytics_.top_n);
    }
}

} // namespace harvestcast
