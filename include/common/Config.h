#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "analytics/AnalyticsConfig.h"
#include "forecast/ForecastConfig.h"

namespace harvestcast {

struct DataConfig {
    std::string prices_csv = "data/agmarknet_prices.csv";
    std::string model_dir = "models";
    std::string journal_path = "logs/training_journal.jsonl";
};

struct LoggingConfig {
    std::string dir = "logs";
    std::string level = "info";
};

// Built once in main and handed to the services that need it.
class Config {
public:
    Config() = default;

    // Missing file or keys keep the defaults; returns false only on parse errors
    bool load(const std::string& config_path);
    void apply(const nlohmann::json& j);

    const DataConfig& getDataConfig() const { return data_; }
    const LoggingConfig& getLoggingConfig() const { return logging_; }
    const forecast::ForecastConfig& getForecastConfig() const { return forecast_; }
    const analytics::AnalyticsConfig& getAnalyticsConfig() const { return analytics_; }

private:
    DataConfig data_;
    LoggingConfig logging_;
    forecast::ForecastConfig forecast_;
    analytics::AnalyticsConfig analytics_;
};

} // namespace harvestcast
