#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "analytics/MarketAnalytics.h"
#include "core/state/ModelArtifactStoreJson.h"
#include "core/state/TrainingJournalJsonl.h"
#include "data/PriceDataLoader.h"
#include "data/TimeSeriesStore.h"
#include "engine/AdvisoryService.h"
#include "engine/RecommendationPolicy.h"
#include "engine/ResultJson.h"
#include "forecast/ConfidenceEstimator.h"
#include "forecast/EnsembleForecaster.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace harvestcast;

namespace {

void printUsage() {
    std::cout
        << "Usage: harvestcast [--config <path>] <command> [options]\n\n"
        << "Commands:\n"
        << "  query        --commodity C [--state S] [--market M] [--days N]\n"
        << "  volatility   --commodity C --state S [--days N]\n"
        << "  trend        --commodity C --state S [--days N]\n"
        << "  seasonality  --commodity C [--state S] [--days N]\n"
        << "  anomalies    --commodity C --state S [--days N] [--sensitivity X]\n"
        << "  compare      --commodity C --state S [--days N] [--top N]\n"
        << "  movers       --state S [--days N] [--top N]\n"
        << "  report       --commodity C --state S [--days N]\n"
        << "  train        --commodity C --state S [--market M]\n"
        << "  train-all    [--state S]\n"
        << "  predict      --commodity C --state S [--market M] [--horizon N]\n"
        << "  model        --commodity C --state S [--market M]\n"
        << "  advise       --commodity C --state S [--price P] [--msp P] [--market M]\n";
}

class Options {
public:
    Options(int argc, char* argv[], int first) {
        for (int i = first; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
                throw std::invalid_argument("unexpected argument: " + arg);
            }
            values_[arg.substr(2)] = argv[++i];
        }
    }

    std::optional<std::string> get(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string require(const std::string& name) const {
        auto value = get(name);
        if (!value) {
            throw std::invalid_argument("missing --" + name);
        }
        return *value;
    }

    int getInt(const std::string& name, int fallback) const {
        auto value = get(name);
        return value ? std::stoi(*value) : fallback;
    }

    std::optional<double> getDouble(const std::string& name) const {
        auto value = get(name);
        if (!value) {
            return std::nullopt;
        }
        return std::stod(*value);
    }

    // --state is the primary spelling; --region is accepted as an alias
    std::optional<std::string> region() const {
        auto state = get("state");
        return state ? state : get("region");
    }

    std::string requireRegion() const {
        auto value = region();
        if (!value) {
            throw std::invalid_argument("missing --state");
        }
        return *value;
    }

private:
    std::map<std::string, std::string> values_;
};

void print(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config/config.json";
    int next = 1;
    if (argc > 2 && std::string(argv[1]) == "--config") {
        config_path = argv[2];
        next = 3;
    }

    if (next >= argc) {
        printUsage();
        return 1;
    }
    const std::string command = argv[next];
    if (command == "--help" || command == "help") {
        printUsage();
        return 0;
    }

    try {
        Config config;
        if (!config.load(config_path)) {
            std::cerr << "Config parse failed; continuing with defaults\n";
        }

        const auto& logging_cfg = config.getLoggingConfig();
        Logger::getInstance().initialize(
            utils::PathUtils::resolveRelativePath(logging_cfg.dir).string(), logging_cfg.level);

        const Options options(argc, argv, next + 1);
        const auto& data_cfg = config.getDataConfig();
        const auto& analytics_cfg = config.getAnalyticsConfig();
        const auto& forecast_cfg = config.getForecastConfig();

        data::TimeSeriesStore store;
        const auto prices_path = utils::PathUtils::resolveRelativePath(data_cfg.prices_csv);
        store.ingest(data::PriceDataLoader::loadCSV(prices_path.string()));
        LOG_INFO("Loaded {} price records from {}", store.size(), prices_path.string());

        auto artifact_store = std::make_shared<core::ModelArtifactStoreJson>(
            utils::PathUtils::resolveRelativePath(data_cfg.model_dir));
        std::shared_ptr<core::ITrainingJournal> journal;
        if (!data_cfg.journal_path.empty()) {
            journal = std::make_shared<core::TrainingJournalJsonl>(
                utils::PathUtils::resolveRelativePath(data_cfg.journal_path));
        }

        analytics::MarketAnalytics analytics(store);
        forecast::EnsembleForecaster forecaster(artifact_store, forecast_cfg);
        forecast::ConfidenceEstimator confidence;
        engine::RecommendationPolicy policy;
        engine::AdvisoryService service(store, analytics, forecaster, confidence, policy,
                                        journal, analytics_cfg);

        if (command == "query") {
            print(engine::toJson(store.query(options.require("commodity"), options.region(),
                                             options.get("market"),
                                             options.getInt("days", analytics_cfg.comparison_window_days))));
        } else if (command == "volatility") {
            print(engine::toJson(analytics.volatility(
                options.require("commodity"), options.requireRegion(),
                options.getInt("days", analytics_cfg.volatility_window_days))));
        } else if (command == "trend") {
            print(engine::toJson(analytics.trend(
                options.require("commodity"), options.requireRegion(),
                options.getInt("days", analytics_cfg.trend_window_days))));
        } else if (command == "seasonality") {
            print(engine::toJson(analytics.seasonality(
                options.require("commodity"), options.region(),
                options.getInt("days", analytics_cfg.seasonal_window_days))));
        } else if (command == "anomalies") {
            const auto sensitivity = options.getDouble("sensitivity");
            print(engine::toJson(analytics.anomalies(
                options.require("commodity"), options.requireRegion(),
                options.getInt("days", analytics_cfg.anomaly_window_days),
                sensitivity ? *sensitivity : analytics_cfg.anomaly_sensitivity)));
        } else if (command == "compare") {
            nlohmann::json out = nlohmann::json::array();
            for (const auto& quote : analytics.compareMarkets(
                     options.require("commodity"), options.requireRegion(),
                     static_cast<std::size_t>(options.getInt("top", analytics_cfg.top_n)),
                     options.getInt("days", analytics_cfg.comparison_window_days))) {
                out.push_back(engine::toJson(quote));
            }
            print(out);
        } else if (command == "movers") {
            print(engine::toJson(analytics.topMovers(
                options.requireRegion(),
                options.getInt("days", analytics_cfg.trend_window_days),
                static_cast<std::size_t>(options.getInt("top", analytics_cfg.top_n)))));
        } else if (command == "report") {
            print(engine::toJson(analytics.marketReport(
                options.require("commodity"), options.requireRegion(),
                options.getInt("days", analytics_cfg.volatility_window_days))));
        } else if (command == "train") {
            const bool trained = service.train(options.require("commodity"),
                                               options.requireRegion(), options.get("market"));
            print(nlohmann::json{{"success", trained}});
        } else if (command == "train-all") {
            std::vector<engine::TrainRequest> requests;
            const auto only_region = options.region();
            const auto regions = only_region ? std::vector<std::string>{*only_region}
                                             : store.regions();
            for (const auto& region : regions) {
                for (const auto& commodity : store.commoditiesInRegion(region)) {
                    requests.push_back({commodity, region, std::nullopt});
                }
            }
            nlohmann::json out = nlohmann::json::array();
            for (const auto& outcome : service.trainMany(requests)) {
                out.push_back(engine::toJson(outcome));
            }
            print(out);
        } else if (command == "predict") {
            print(engine::toJson(service.predict(
                options.require("commodity"), options.requireRegion(), options.get("market"),
                options.getInt("horizon", forecast_cfg.default_horizon_days))));
        } else if (command == "model") {
            const auto info = forecaster.modelInfo(SeriesKey::make(
                options.require("commodity"), options.requireRegion(), options.get("market")));
            if (!info) {
                std::cerr << "No trained model\n";
                return 2;
            }
            print(engine::toJson(*info));
        } else if (command == "advise") {
            print(engine::toJson(service.advise(
                options.require("commodity"), options.requireRegion(),
                options.getDouble("price"), options.getDouble("msp"), options.get("market"))));
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage();
            return 1;
        }
        return 0;
    } catch (const InsufficientDataError& e) {
        LOG_WARN("{}", e.what());
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const ModelUnavailableError& e) {
        LOG_WARN("{}", e.what());
        std::cerr << e.what() << " (run `harvestcast train` first)" << std::endl;
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
